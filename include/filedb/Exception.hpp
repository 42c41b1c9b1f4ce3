#ifndef DIASPORA_FILEDB_EXCEPTION_HPP
#define DIASPORA_FILEDB_EXCEPTION_HPP

#include <diaspora/Exception.hpp>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace filedb {

/**
 * Base class of every error raised by the reader.
 */
class Exception : public diaspora::Exception {
public:
    explicit Exception(const std::string& message)
    : diaspora::Exception{message} {}
};

// The index file or the blob file could not be opened
class OpenError : public Exception {
public:
    using Exception::Exception;
};

// Requested index or range exceeds the entry count
class OutOfBounds : public Exception {
public:
    using Exception::Exception;
};

// Batch request with end <= start
class InvalidRange : public Exception {
public:
    using Exception::Exception;
};

// Decoded offsets violate loc_i <= loc_{i+1}, or point past the blob file
class Corrupted : public Exception {
public:
    using Exception::Exception;
};

// A positioned read on the index file failed or came back short
class ReadError : public Exception {
public:
    using Exception::Exception;
};

/**
 * The queried timestamp is not smaller than the last entry's timestamp.
 * index() is where such an entry would be found, i.e. the store's length.
 */
class NotInRange : public Exception {
public:
    NotInRange(const std::string& message, uint64_t index)
    : Exception{message}
    , m_index(index) {}

    uint64_t index() const noexcept { return m_index; }

private:
    uint64_t m_index;
};

/**
 * Raised by findTimeRange when either lookup fails.
 * first()/second() hold the indices computed before (or alongside) the
 * failure; cause() holds the underlying error.
 */
class TimeRangeError : public Exception {
public:
    TimeRangeError(const std::string& message,
                   std::optional<uint64_t> first,
                   std::optional<uint64_t> second,
                   std::exception_ptr cause)
    : Exception{message}
    , m_first(first)
    , m_second(second)
    , m_cause(std::move(cause)) {}

    std::optional<uint64_t> first() const { return m_first; }
    std::optional<uint64_t> second() const { return m_second; }
    std::exception_ptr cause() const { return m_cause; }

private:
    std::optional<uint64_t> m_first;
    std::optional<uint64_t> m_second;
    std::exception_ptr      m_cause;
};

}

#endif
