#include "memo_cache/config.hpp"

#include <catch2/catch.hpp>

#include <fstream>

using namespace memo_cache;

TEST_CASE("Config file fields override defaults", "[config]") {
  const char *path = "memo_config_good.json";
  std::ofstream out(path);
  out << R"({"ttl_ms": 250, "max_size": 64, "algorithm": "FIFO", "thread_safe": false})";
  out.close();

  MemoConfig cfg;
  std::string err;
  REQUIRE(load_config_file(path, cfg, &err));
  REQUIRE(cfg.ttl.has_value());
  CHECK(cfg.ttl->count() == 250);
  CHECK(cfg.max_size == 64);
  CHECK(cfg.algorithm == "FIFO");
  CHECK_FALSE(cfg.thread_safe);
  CHECK(validate_config(cfg) == Algorithm::Fifo);
}

TEST_CASE("Missing fields keep current values", "[config]") {
  MemoConfig cfg;
  cfg.max_size = 10;
  REQUIRE(parse_config_json(R"({"algorithm":"lfu"})", cfg));
  CHECK(cfg.max_size == 10);
  CHECK(cfg.algorithm == "lfu");
  CHECK_FALSE(cfg.ttl.has_value());
  CHECK(cfg.thread_safe);
}

TEST_CASE("Invalid config is rejected atomically", "[config]") {
  MemoConfig cfg;
  cfg.max_size = 5;
  std::string err;
  CHECK_FALSE(parse_config_json(R"({"max_size": 0, "algorithm": "fifo"})", cfg, &err));
  CHECK(err.find("max_size") != std::string::npos);
  CHECK(cfg.max_size == 5);
  CHECK(cfg.algorithm == "lru");

  CHECK_FALSE(parse_config_json(R"({"algorithm": "mru"})", cfg, &err));
  CHECK(err.find("mru") != std::string::npos);
  CHECK_FALSE(parse_config_json(R"({"ttl_ms": -1})", cfg, &err));
  CHECK_FALSE(parse_config_json("not-json", cfg, &err));
  CHECK(err == "invalid schema");
  CHECK_FALSE(parse_config_json(R"({"max_size": 99999999999999999999})", cfg, &err));
  CHECK_FALSE(load_config_file("does_not_exist.json", cfg, &err));
  CHECK(err.find("not found") != std::string::npos);
}

TEST_CASE("validate_config throws on bad values", "[config]") {
  MemoConfig cfg;
  CHECK(validate_config(cfg) == Algorithm::Lru);
  cfg.max_size = -1;
  CHECK_THROWS_AS(validate_config(cfg), ConfigurationError);
  cfg.max_size = 1;
  cfg.algorithm = "";
  CHECK_THROWS_AS(validate_config(cfg), ConfigurationError);
  CHECK(to_string(Algorithm::Lfu) == "lfu");
  CHECK(parse_algorithm("LrU") == Algorithm::Lru);
  CHECK_FALSE(parse_algorithm("clock").has_value());
}

TEST_CASE("ttl beyond the clock range is rejected", "[config][ttl]") {
  MemoConfig cfg;
  std::string err;
  CHECK_FALSE(parse_config_json(R"({"ttl_ms": 10000000000000})", cfg, &err));
  CHECK(err.find("maximum") != std::string::npos);
  CHECK_FALSE(cfg.ttl.has_value());

  cfg.ttl = kMaxTtl;
  CHECK(validate_config(cfg) == Algorithm::Lru);
  cfg.ttl = kMaxTtl + Duration(1);
  CHECK_THROWS_AS(validate_config(cfg), ConfigurationError);
}
