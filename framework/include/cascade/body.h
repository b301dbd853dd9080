#ifndef CASCADE_BODY_H
#define CASCADE_BODY_H

#include <cascade/async.h>
#include <boost/json/value.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cascade {

/**
 * @brief A source of response bytes read chunk by chunk.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /** @brief Next chunk, or std::nullopt once the stream is exhausted. */
    virtual Async<std::optional<std::string>> read() = 0;
};

/**
 * @brief In-memory stream over a fixed buffer, handed out in chunks.
 */
class BufferStream : public ByteStream {
    std::string data_;
    size_t offset_ = 0;
    size_t chunk_size_;

public:
    explicit BufferStream(std::string data, size_t chunk_size = 16 * 1024);

    Async<std::optional<std::string>> read() override;
};

/**
 * @brief Immutable bytes with an optional MIME type.
 */
class Blob {
    std::shared_ptr<const std::string> data_;
    std::string type_;

public:
    explicit Blob(std::string data, std::string type = "");

    size_t size() const { return data_->size(); }
    const std::string& type() const { return type_; }
    const std::string& data() const { return *data_; }

    /** @brief A fresh stream over the blob's bytes. */
    std::shared_ptr<ByteStream> stream() const;

    friend bool operator==(const Blob& a, const Blob& b) {
        return a.data_ == b.data_ && a.type_ == b.type_;
    }
};

using Bytes = std::vector<std::uint8_t>;
using StreamPtr = std::shared_ptr<ByteStream>;

/**
 * @brief Response body. Alternatives are listed in BodyKind order.
 */
using Body = std::variant<std::monostate, std::string, Bytes, Blob, StreamPtr, boost::json::value>;

enum class BodyKind {
    Empty,
    Text,
    Bytes,
    Blob,
    Stream,
    Structured
};

inline BodyKind kind_of(const Body& body) {
    return static_cast<BodyKind>(body.index());
}

} // namespace cascade

#endif
