#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace memo_cache {

// User-defined argument type. The defaults describe an object that can be
// neither hashed nor compared, which makes any call carrying it uncacheable.
class ArgObject {
public:
  virtual ~ArgObject() = default;
  virtual std::string type_name() const = 0;
  virtual std::optional<std::size_t> hash() const { return std::nullopt; }
  virtual bool comparable() const { return false; }
  // Only called when both sides report comparable() and share type_name().
  virtual bool equals(const ArgObject &) const { return false; }
};

enum class ArgKind { None, Bool, Int, Float, String, Tuple, List, Object };

class Arg;

struct ArgTuple {
  std::vector<Arg> items;
};

struct ArgList {
  std::vector<Arg> items;
};

class Arg {
public:
  Arg() = default;

  static Arg none();
  static Arg boolean(bool v);
  static Arg integer(std::int64_t v);
  static Arg real(double v);
  static Arg string(std::string v);
  static Arg tuple(std::vector<Arg> items);
  static Arg list(std::vector<Arg> items);
  static Arg object(std::shared_ptr<const ArgObject> obj);

  ArgKind kind() const;
  std::string type_name() const;

  // Capability checks used by KeyBuilder.
  std::optional<std::size_t> hash() const;
  bool comparable() const;

  // Type-sensitive structural equality. Integer 3 never equals real 3.0.
  bool equals(const Arg &other) const;
  bool operator==(const Arg &other) const { return equals(other); }

  std::string repr() const;

  bool as_bool() const { return std::get<bool>(value_); }
  std::int64_t as_int() const { return std::get<std::int64_t>(value_); }
  double as_real() const { return std::get<double>(value_); }
  const std::string &as_string() const { return std::get<std::string>(value_); }
  const std::vector<Arg> &items() const;
  const ArgObject &as_object() const {
    return *std::get<std::shared_ptr<const ArgObject>>(value_);
  }

private:
  using Storage =
      std::variant<std::monostate, bool, std::int64_t, double, std::string,
                   ArgTuple, ArgList, std::shared_ptr<const ArgObject>>;

  explicit Arg(Storage v) : value_(std::move(v)) {}

  Storage value_{};
};

using Args = std::vector<Arg>;
using KwArgs = std::vector<std::pair<std::string, Arg>>;

} // namespace memo_cache
