#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace jsonld
{

// The configuration cannot produce the requested output, e.g. framing
// without a frame.
struct ConfigurationError
{
    std::string msg;
};

// The JSON-LD engine failed, or the result could not be serialized.
struct TransformError
{
    std::string msg;
};

// The output sink did not accept the bytes.
struct IOError
{
    std::string msg;
};

using Error = std::variant<ConfigurationError, TransformError, IOError>;

template<typename T>
using E = std::expected<T, Error>;

inline Error configurationError(std::string_view msg)
{
    return ConfigurationError{std::string(msg)};
}

inline Error transformError(std::string_view msg)
{
    return TransformError{std::string(msg)};
}

inline Error ioError(std::string_view msg)
{
    return IOError{std::string(msg)};
}

inline std::string errorMsg(const Error& e)
{
    return std::visit([](const auto& err) { return err.msg; }, e);
}

} // namespace jsonld

#define _CONCAT_NAMES_INNER(a, b) a##b
#define _CONCAT_NAMES(a, b) _CONCAT_NAMES_INNER(a, b)

#define _ASSIGN_OR_RETURN_INNER(tmp, var, val)                          \
    auto tmp = val;                                                     \
    if(!tmp.has_value())                                                \
    {                                                                   \
        return std::unexpected(std::move(tmp).error());                 \
    }                                                                   \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_RETURN(var, val)                                      \
    _ASSIGN_OR_RETURN_INNER(                                            \
        _CONCAT_NAMES(assign_or_return_tmp, __COUNTER__), var, val)

#define _DO_OR_RETURN_INNER(tmp, val)                                   \
    auto tmp = val;                                                     \
    if(!tmp.has_value())                                                \
    {                                                                   \
        return std::unexpected(std::move(tmp).error());                 \
    }

#define DO_OR_RETURN(val)                                               \
    _DO_OR_RETURN_INNER(_CONCAT_NAMES(do_or_return_tmp, __COUNTER__), val)
