/*
 * @FileName   : error.hpp
 * @CreateAt   : 2026/9/15
 * @Description: exception types raised by the store, the executors and the parser
 */

#ifndef QUINT_ERROR_HPP
#define QUINT_ERROR_HPP

#include <string>
#include <stdexcept>

namespace quint {

class QuintError : public std::runtime_error {
public:
    explicit QuintError(const std::string &message) : std::runtime_error(message) {}
};

/* raised by every store operation issued before `open()` */
class StoreNotOpenError : public QuintError {
public:
    StoreNotOpenError() : QuintError("Store not open. Call open() first.") {}
};

/* backend failure, the message and code come from the SQL engine unchanged */
class SqlError : public QuintError {
public:
    SqlError(const std::string &message, int code)
        : QuintError(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

class ParseError : public QuintError {
public:
    ParseError(const std::string &message, size_t offset)
        : QuintError(message + " (at offset " + std::to_string(offset) + ")"), offset_(offset) {}

    size_t offset() const { return offset_; }

private:
    size_t offset_;
};

/* query shape the engine cannot run without a general SPARQL evaluator */
class UnsupportedQueryError : public QuintError {
public:
    explicit UnsupportedQueryError(const std::string &message) : QuintError(message) {}
};

} // namespace quint

#endif //QUINT_ERROR_HPP
