#include "environment.hpp"

#include <expected>

namespace sable {

void Environment::define(const std::string &name, std::optional<Value> value)
{
    values.insert_or_assign(name, std::move(value));
}

Result<Value> Environment::get(const std::string &name) const
{
    for (const Environment *env = this; env != nullptr; env = env->enclosing_.get())
    {
        auto it = env->values.find(name);
        if (it == env->values.end())
            continue;
        if (!it->second.has_value())
            return std::unexpected(err::runtime(err::Kind::Variable_not_initialized,
                                                "Variable '" + name + "' is not initialized"));
        return *it->second;
    }
    return std::unexpected(err::runtime(err::Kind::Variable_not_found, "Undefined variable '" + name + "'"));
}

Result<void> Environment::assign(const std::string &name, const Value &value)
{
    if (auto it = values.find(name); it != values.end())
    {
        it->second = value;
        return {};
    }
    if (enclosing_ != nullptr)
        return enclosing_->assign(name, value);
    return std::unexpected(err::runtime(err::Kind::Variable_not_found, "Undefined variable '" + name + "'"));
}

} // namespace sable
