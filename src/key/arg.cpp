#include "memo_cache/arg.hpp"

#include <cmath>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace memo_cache {
namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

std::uint64_t mix(std::uint64_t h, std::uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    h ^= (v >> (i * 8)) & 0xFF;
    h *= kFnvPrime;
  }
  return h;
}

std::uint64_t fnv1a(const std::string &s) {
  std::uint64_t hash = kFnvOffset;
  for (unsigned char c : s) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

std::uint64_t double_bits(double v) {
  if (v == 0.0)
    v = 0.0; // -0.0 compares equal to 0.0 and must hash the same
  std::uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  return bits;
}

bool items_equal(const std::vector<Arg> &a, const std::vector<Arg> &b) {
  if (a.size() != b.size())
    return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!a[i].equals(b[i]))
      return false;
  }
  return true;
}

void repr_items(std::ostringstream &os, const std::vector<Arg> &items) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i)
      os << ", ";
    os << items[i].repr();
  }
}

} // namespace

Arg Arg::none() { return Arg(Storage{std::monostate{}}); }
Arg Arg::boolean(bool v) { return Arg(Storage{v}); }
Arg Arg::integer(std::int64_t v) { return Arg(Storage{v}); }
Arg Arg::real(double v) { return Arg(Storage{v}); }
Arg Arg::string(std::string v) {
  return Arg(Storage{std::in_place_type<std::string>, std::move(v)});
}
Arg Arg::tuple(std::vector<Arg> items) {
  return Arg(Storage{ArgTuple{std::move(items)}});
}
Arg Arg::list(std::vector<Arg> items) {
  return Arg(Storage{ArgList{std::move(items)}});
}
Arg Arg::object(std::shared_ptr<const ArgObject> obj) {
  if (!obj)
    throw std::invalid_argument("Arg::object requires a non-null object");
  return Arg(Storage{std::move(obj)});
}

ArgKind Arg::kind() const {
  switch (value_.index()) {
  case 0:
    return ArgKind::None;
  case 1:
    return ArgKind::Bool;
  case 2:
    return ArgKind::Int;
  case 3:
    return ArgKind::Float;
  case 4:
    return ArgKind::String;
  case 5:
    return ArgKind::Tuple;
  case 6:
    return ArgKind::List;
  default:
    return ArgKind::Object;
  }
}

std::string Arg::type_name() const {
  switch (kind()) {
  case ArgKind::None:
    return "none";
  case ArgKind::Bool:
    return "bool";
  case ArgKind::Int:
    return "int";
  case ArgKind::Float:
    return "float";
  case ArgKind::String:
    return "str";
  case ArgKind::Tuple:
    return "tuple";
  case ArgKind::List:
    return "list";
  case ArgKind::Object:
    return as_object().type_name();
  }
  return "unknown";
}

const std::vector<Arg> &Arg::items() const {
  if (const auto *t = std::get_if<ArgTuple>(&value_))
    return t->items;
  return std::get<ArgList>(value_).items;
}

std::optional<std::size_t> Arg::hash() const {
  std::uint64_t h = mix(kFnvOffset, static_cast<std::uint64_t>(value_.index()));
  switch (kind()) {
  case ArgKind::None:
    break;
  case ArgKind::Bool:
    h = mix(h, as_bool() ? 1 : 0);
    break;
  case ArgKind::Int:
    h = mix(h, static_cast<std::uint64_t>(as_int()));
    break;
  case ArgKind::Float:
    if (std::isnan(as_real()))
      return std::nullopt;
    h = mix(h, double_bits(as_real()));
    break;
  case ArgKind::String:
    h = mix(h, fnv1a(as_string()));
    break;
  case ArgKind::Tuple:
    for (const auto &item : items()) {
      auto ih = item.hash();
      if (!ih)
        return std::nullopt;
      h = mix(h, *ih);
    }
    break;
  case ArgKind::List:
    return std::nullopt;
  case ArgKind::Object: {
    const auto &obj = as_object();
    if (!obj.comparable())
      return std::nullopt;
    auto oh = obj.hash();
    if (!oh)
      return std::nullopt;
    h = mix(mix(h, fnv1a(obj.type_name())), *oh);
    break;
  }
  }
  return static_cast<std::size_t>(h);
}

bool Arg::comparable() const {
  switch (kind()) {
  case ArgKind::Tuple:
  case ArgKind::List:
    for (const auto &item : items()) {
      if (!item.comparable())
        return false;
    }
    return true;
  case ArgKind::Object:
    return as_object().comparable();
  case ArgKind::Float:
    // NaN never equals itself, so no call carrying it can be found again.
    return !std::isnan(as_real());
  default:
    return true;
  }
}

bool Arg::equals(const Arg &other) const {
  if (value_.index() != other.value_.index())
    return false;
  switch (kind()) {
  case ArgKind::None:
    return true;
  case ArgKind::Bool:
    return as_bool() == other.as_bool();
  case ArgKind::Int:
    return as_int() == other.as_int();
  case ArgKind::Float:
    return as_real() == other.as_real();
  case ArgKind::String:
    return as_string() == other.as_string();
  case ArgKind::Tuple:
  case ArgKind::List:
    return items_equal(items(), other.items());
  case ArgKind::Object: {
    const auto &a = as_object();
    const auto &b = other.as_object();
    if (!a.comparable() || !b.comparable())
      return false;
    return a.type_name() == b.type_name() && a.equals(b);
  }
  }
  return false;
}

std::string Arg::repr() const {
  std::ostringstream os;
  switch (kind()) {
  case ArgKind::None:
    os << "None";
    break;
  case ArgKind::Bool:
    os << (as_bool() ? "True" : "False");
    break;
  case ArgKind::Int:
    os << as_int();
    break;
  case ArgKind::Float:
    os << as_real();
    if (os.str().find_first_of(".eEn") == std::string::npos)
      os << ".0";
    break;
  case ArgKind::String:
    os << "'" << as_string() << "'";
    break;
  case ArgKind::Tuple:
    os << "(";
    repr_items(os, items());
    if (items().size() == 1)
      os << ",";
    os << ")";
    break;
  case ArgKind::List:
    os << "[";
    repr_items(os, items());
    os << "]";
    break;
  case ArgKind::Object:
    os << "<" << as_object().type_name() << ">";
    break;
  }
  return os.str();
}

} // namespace memo_cache
