#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "../value/value.hpp"
#include "../error/result.hpp"
#include "../memory/ref_counted.hpp"

namespace sable {

// One scope frame. A binding without a value is declared but not yet
// initialized; reading it is an error distinct from an unknown name.
class Environment
{
private:
    std::unordered_map<std::string, std::optional<Value>> values;
    mem::rc_ptr<Environment> enclosing_;

public:
    Environment() : enclosing_(nullptr) {}
    explicit Environment(mem::rc_ptr<Environment> enclosing) : enclosing_(std::move(enclosing)) {}

    // Redefinition in the same frame overwrites in place.
    void define(const std::string &name, std::optional<Value> value);

    Result<Value> get(const std::string &name) const;
    Result<void> assign(const std::string &name, const Value &value);

    bool contains(const std::string &name) const { return values.contains(name); }
    // Drops every binding in this frame only.
    void clear() { values.clear(); }
    const mem::rc_ptr<Environment> &enclosing() const { return enclosing_; }
};

} // namespace sable
