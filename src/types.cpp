#include "vecsearch/types.h"

#include <algorithm>
#include <cstring>
#include <sstream>

namespace vecsearch {

namespace {

struct Encoder {
  std::string operator()(std::monostate) const { return "n"; }
  std::string operator()(bool b) const { return b ? "b:1" : "b:0"; }
  std::string operator()(std::int64_t i) const { return "i:" + std::to_string(i); }
  std::string operator()(double d) const {
    // Bit pattern, so 0.1 and 0.1000000001 stay distinct.
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(d), "double must be 64-bit");
    std::memcpy(&bits, &d, sizeof(d));
    return "d:" + std::to_string(bits);
  }
  std::string operator()(const std::string& s) const {
    return "s" + std::to_string(s.size()) + ":" + s;
  }
  std::string operator()(const std::vector<std::string>& list) const {
    std::string out = "l" + std::to_string(list.size()) + "[";
    for (const auto& s : list) {
      out += (*this)(s);
    }
    out += "]";
    return out;
  }
};

} // namespace

std::string encode_payload_value(const PayloadValue& value) {
  return std::visit(Encoder{}, value);
}

Filter& Filter::equals(std::string key, PayloadValue value) {
  add(Condition{std::move(key), Op::EQUALS, {std::move(value)}});
  return *this;
}

Filter& Filter::one_of(std::string key, std::vector<PayloadValue> values) {
  std::sort(values.begin(), values.end(), [](const PayloadValue& a, const PayloadValue& b) {
    return encode_payload_value(a) < encode_payload_value(b);
  });
  add(Condition{std::move(key), Op::ONE_OF, std::move(values)});
  return *this;
}

Filter& Filter::exists(std::string key) {
  add(Condition{std::move(key), Op::EXISTS, {}});
  return *this;
}

void Filter::add(Condition c) {
  conditions_.push_back(std::move(c));
  std::stable_sort(conditions_.begin(), conditions_.end(), [](const Condition& a, const Condition& b) {
    if (a.key != b.key) {
      return a.key < b.key;
    }
    return a.op < b.op;
  });
}

bool Filter::matches(const Payload& payload) const {
  for (const auto& c : conditions_) {
    const auto it = payload.find(c.key);
    if (it == payload.end()) {
      return false;
    }
    switch (c.op) {
      case Op::EXISTS:
        break;
      case Op::EQUALS:
        if (!(it->second == c.values.front())) {
          return false;
        }
        break;
      case Op::ONE_OF:
        if (std::find(c.values.begin(), c.values.end(), it->second) == c.values.end()) {
          return false;
        }
        break;
    }
  }
  return true;
}

std::string Filter::canonical() const {
  std::ostringstream os;
  for (const auto& c : conditions_) {
    os << c.key.size() << ':' << c.key << '/' << static_cast<int>(c.op) << '/';
    for (const auto& v : c.values) {
      os << encode_payload_value(v);
    }
    os << ';';
  }
  return os.str();
}

} // namespace vecsearch
