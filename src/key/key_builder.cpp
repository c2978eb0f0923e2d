#include "memo_cache/key_builder.hpp"

#include <algorithm>
#include <functional>
#include <sstream>

namespace memo_cache {
namespace {

constexpr std::uint64_t kKeywordMark = 0x9e3779b97f4a7c15ull;

std::size_t combine(std::size_t seed, std::size_t v) {
  return seed ^ (v + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

} // namespace

CacheKey CacheKey::hashable(std::size_t hash, Args positional,
                            KwArgs keywords) {
  return CacheKey(Form::Hashable, hash, std::move(positional),
                  std::move(keywords));
}

CacheKey CacheKey::structural(Args positional, KwArgs keywords) {
  return CacheKey(Form::Structural, 0, std::move(positional),
                  std::move(keywords));
}

bool CacheKey::operator==(const CacheKey &other) const {
  if (form_ != other.form_ || hash_ != other.hash_)
    return false;
  if (positional_.size() != other.positional_.size() ||
      keywords_.size() != other.keywords_.size())
    return false;
  for (std::size_t i = 0; i < positional_.size(); ++i) {
    if (!positional_[i].equals(other.positional_[i]))
      return false;
  }
  for (std::size_t i = 0; i < keywords_.size(); ++i) {
    if (keywords_[i].first != other.keywords_[i].first ||
        !keywords_[i].second.equals(other.keywords_[i].second))
      return false;
  }
  return true;
}

std::string CacheKey::repr() const {
  std::ostringstream os;
  os << "(";
  bool first = true;
  for (const auto &a : positional_) {
    if (!first)
      os << ", ";
    os << a.repr();
    first = false;
  }
  for (const auto &[name, value] : keywords_) {
    if (!first)
      os << ", ";
    os << name << "=" << value.repr();
    first = false;
  }
  os << ")";
  return os.str();
}

std::optional<CacheKey> KeyBuilder::build(const Args &positional,
                                          const KwArgs &keywords,
                                          std::string *err) const {
  KwArgs sorted = keywords;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });
  for (std::size_t i = 1; i < sorted.size(); ++i) {
    if (sorted[i].first == sorted[i - 1].first) {
      if (err)
        *err = "duplicate keyword argument '" + sorted[i].first + "'";
      return std::nullopt;
    }
  }

  bool hashable = true;
  std::size_t h = positional.size();
  auto admit = [&](const Arg &a) {
    if (!hashable)
      return a.comparable();
    auto ah = a.hash();
    if (ah) {
      h = combine(h, *ah);
      return true;
    }
    hashable = false;
    return a.comparable();
  };

  for (const auto &a : positional) {
    if (!admit(a)) {
      if (err)
        *err = "unhashable and incomparable argument of type " + a.type_name();
      return std::nullopt;
    }
  }
  h = combine(h, static_cast<std::size_t>(kKeywordMark));
  for (const auto &[name, value] : sorted) {
    h = combine(h, std::hash<std::string>{}(name));
    if (!admit(value)) {
      if (err)
        *err = "unhashable and incomparable keyword argument '" + name +
               "' of type " + value.type_name();
      return std::nullopt;
    }
  }

  if (hashable)
    return CacheKey::hashable(h, positional, std::move(sorted));
  return CacheKey::structural(positional, std::move(sorted));
}

} // namespace memo_cache
