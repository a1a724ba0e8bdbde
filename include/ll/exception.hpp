/**
 * @file exception.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#pragma once

#include <sstream>
#include <string>
#include <exception>

namespace ll {

/**
 * @brief Helper for building exception messages with stream operators.
 *
 */
class Formatter {
 public:
    Formatter() {}
    ~Formatter() {}

    template <typename Type>
    inline Formatter &operator<<(const Type &value) {
        stream_ << value;
        return *this;
    }

    inline std::string str() const { return stream_.str(); }
    inline operator std::string() const { return stream_.str(); }

 private:
    std::stringstream stream_;

    Formatter(const Formatter &);
    Formatter &operator=(Formatter &);
};

/**
 * @brief Library exception. Use the LL_Error macro to create one so that the
 * source location is included in the message.
 *
 */
class exception : public std::exception {
 public:
    explicit exception(const char *msg) : msg_(msg) {}
    explicit exception(const Formatter &msg) : msg_(msg.str()) {}
    ~exception() override {}

    const char *what() const noexcept override { return msg_.c_str(); }

 private:
    std::string msg_;
};

}  // namespace ll

#define LL_Error(A) (ll::exception(ll::Formatter() << A << " [" << __FILE__ << ":" << __LINE__ << "]"))
