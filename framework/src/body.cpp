#include <cascade/body.h>
#include <algorithm>

namespace cascade {

BufferStream::BufferStream(std::string data, size_t chunk_size)
    : data_(std::move(data)), chunk_size_(std::max<size_t>(chunk_size, 1)) {
}

Async<std::optional<std::string>> BufferStream::read() {
    if (offset_ >= data_.size()) {
        co_return std::nullopt;
    }
    const size_t n = std::min(chunk_size_, data_.size() - offset_);
    std::string chunk = data_.substr(offset_, n);
    offset_ += n;
    co_return chunk;
}

Blob::Blob(std::string data, std::string type)
    : data_(std::make_shared<const std::string>(std::move(data))), type_(std::move(type)) {
}

std::shared_ptr<ByteStream> Blob::stream() const {
    return std::make_shared<BufferStream>(*data_);
}

} // namespace cascade
