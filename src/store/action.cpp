#include "sth_store.hpp"

#include <random>

namespace statehub::store
{

namespace
{

// Six base-36 characters joined by dots, e.g. "k.3.x.0.q.z".
std::string random_suffix()
{
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> pick(0, 35);

    std::string out;
    for (int i = 0; i < 6; ++i)
    {
        if (i > 0)
            out.push_back('.');
        out.push_back(kAlphabet[pick(gen)]);
    }
    return out;
}

const std::string &process_suffix()
{
    static const std::string suffix = random_suffix();
    return suffix;
}

} // anonymous namespace

std::string action_type_name(const Action &action)
{
    if (!has_action_type(action))
        return "<none>";
    const auto &type = action.at(kActionTypeKey);
    return type.is_string() ? type.get<std::string>() : type.dump();
}

namespace action_types
{

const std::string &init()
{
    static const std::string type = "@@statehub/INIT" + process_suffix();
    return type;
}

const std::string &replace()
{
    static const std::string type = "@@statehub/REPLACE" + process_suffix();
    return type;
}

bool is_reserved(const Action &action)
{
    if (!has_action_type(action))
        return false;
    const auto &type = action.at(kActionTypeKey);
    return type.is_string() && (type == init() || type == replace());
}

} // namespace action_types

StoreError::StoreError(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), m_kind(kind)
{
}

const char *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::InvalidAction:
        return "InvalidAction";
    case ErrorKind::IllegalStateAccess:
        return "IllegalStateAccess";
    case ErrorKind::PrematureDispatch:
        return "PrematureDispatch";
    default:
        return "Unknown";
    }
}

} // namespace statehub::store
