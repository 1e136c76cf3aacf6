#include "HeaderSet.hpp"

namespace sshed {
HeaderSet::HeaderSet(std::initializer_list<pair<string, HeaderValue>> init) {
  for (const auto& it : init) {
    set(it.first, it.second);
  }
}

void HeaderSet::set(const string& name, const HeaderValue& value) {
  for (auto& it : headers) {
    if (it.first == name) {
      it.second = value;
      return;
    }
  }
  headers.push_back(make_pair(name, value));
}

void HeaderSet::add(const string& name, const HeaderValue& value) {
  if (has(name)) {
    throw MalformedPacketError("Duplicate header: " + name);
  }
  headers.push_back(make_pair(name, value));
}

bool HeaderSet::has(const string& name) const {
  for (const auto& it : headers) {
    if (it.first == name) {
      return true;
    }
  }
  return false;
}

optional<HeaderValue> HeaderSet::get(const string& name) const {
  for (const auto& it : headers) {
    if (it.first == name) {
      return it.second;
    }
  }
  return nullopt;
}

void HeaderSet::erase(const string& name) {
  headers.erase(remove_if(headers.begin(), headers.end(),
                          [&name](const pair<string, HeaderValue>& it) {
                            return it.first == name;
                          }),
                headers.end());
}

bool HeaderSet::operator==(const HeaderSet& other) const {
  if (size() != other.size()) {
    return false;
  }
  for (const auto& it : headers) {
    auto otherValue = other.get(it.first);
    if (!otherValue || *otherValue != it.second) {
      return false;
    }
  }
  return true;
}

ostream& operator<<(ostream& os, const HeaderSet& self) {
  os << "{";
  bool first = true;
  for (const auto& it : self) {
    if (!first) {
      os << ", ";
    }
    first = false;
    os << it.first << ": " << it.second;
  }
  return os << "}", os;
}
}  // namespace sshed
