#include "memo_cache/policy.hpp"

#include <iterator>
#include <list>
#include <unordered_map>

namespace memo_cache {
namespace {

// Shared by LRU and FIFO: front is the next victim.
class OrderedPolicy : public IEvictionPolicy {
public:
  void on_insert(std::uint64_t id) override {
    order_.push_back(id);
    index_[id] = std::prev(order_.end());
  }
  void on_erase(std::uint64_t id) override {
    auto it = index_.find(id);
    if (it == index_.end())
      return;
    order_.erase(it->second);
    index_.erase(it);
  }
  std::optional<std::uint64_t> pick_victim() const override {
    if (order_.empty())
      return std::nullopt;
    return order_.front();
  }
  std::size_t size() const override { return index_.size(); }
  void clear() override {
    order_.clear();
    index_.clear();
  }

protected:
  std::list<std::uint64_t> order_;
  std::unordered_map<std::uint64_t, std::list<std::uint64_t>::iterator> index_;
};

class LruPolicy final : public OrderedPolicy {
public:
  std::string name() const override { return "lru"; }
  Algorithm algorithm() const override { return Algorithm::Lru; }
  void on_access(std::uint64_t id) override {
    auto it = index_.find(id);
    if (it == index_.end())
      return;
    order_.splice(order_.end(), order_, it->second);
  }
};

class FifoPolicy final : public OrderedPolicy {
public:
  std::string name() const override { return "fifo"; }
  Algorithm algorithm() const override { return Algorithm::Fifo; }
  void on_access(std::uint64_t) override {}
};

// Frequency buckets kept in ascending order, so the front bucket is always
// the minimum frequency. Within a bucket, front is the oldest arrival.
class LfuPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lfu"; }
  Algorithm algorithm() const override { return Algorithm::Lfu; }

  void on_insert(std::uint64_t id) override {
    if (buckets_.empty() || buckets_.front().freq != 1)
      buckets_.push_front(Bucket{1, {}});
    auto bucket = buckets_.begin();
    bucket->items.push_back(id);
    nodes_[id] = Node{bucket, std::prev(bucket->items.end())};
  }

  void on_access(std::uint64_t id) override {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
      return;
    auto &node = it->second;
    auto current = node.bucket;
    auto next = std::next(current);
    if (next == buckets_.end() || next->freq != current->freq + 1)
      next = buckets_.insert(next, Bucket{current->freq + 1, {}});
    next->items.splice(next->items.end(), current->items, node.item);
    node.bucket = next;
    if (current->items.empty())
      buckets_.erase(current);
  }

  void on_erase(std::uint64_t id) override {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
      return;
    auto bucket = it->second.bucket;
    bucket->items.erase(it->second.item);
    if (bucket->items.empty())
      buckets_.erase(bucket);
    nodes_.erase(it);
  }

  std::optional<std::uint64_t> pick_victim() const override {
    if (buckets_.empty())
      return std::nullopt;
    return buckets_.front().items.front();
  }

  std::size_t size() const override { return nodes_.size(); }

  void clear() override {
    buckets_.clear();
    nodes_.clear();
  }

private:
  struct Bucket {
    std::uint64_t freq;
    std::list<std::uint64_t> items;
  };
  struct Node {
    std::list<Bucket>::iterator bucket;
    std::list<std::uint64_t>::iterator item;
  };

  std::list<Bucket> buckets_;
  std::unordered_map<std::uint64_t, Node> nodes_;
};

} // namespace

std::unique_ptr<IEvictionPolicy> make_policy(Algorithm algorithm) {
  switch (algorithm) {
  case Algorithm::Lfu:
    return std::make_unique<LfuPolicy>();
  case Algorithm::Fifo:
    return std::make_unique<FifoPolicy>();
  case Algorithm::Lru:
    break;
  }
  return std::make_unique<LruPolicy>();
}

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode) {
  auto algorithm = parse_algorithm(mode);
  if (!algorithm)
    throw ConfigurationError("unrecognized algorithm '" + mode + "'");
  return make_policy(*algorithm);
}

} // namespace memo_cache
