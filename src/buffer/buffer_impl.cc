#include "duplex/buffer.h"

#include <algorithm>

namespace duplex {

OwnedBuffer::OwnedBuffer(const std::string& data) { add(data); }

OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept
    : slices_(std::move(other.slices_)), length_(other.length_) {
  other.slices_.clear();
  other.length_ = 0;
}

OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept {
  if (this != &other) {
    slices_ = std::move(other.slices_);
    length_ = other.length_;
    other.slices_.clear();
    other.length_ = 0;
  }
  return *this;
}

void OwnedBuffer::add(const void* data, size_t size) {
  if (size == 0) {
    return;
  }
  slices_.emplace_back(static_cast<const char*>(data), size);
  length_ += size;
}

void OwnedBuffer::add(const std::string& data) {
  add(data.data(), data.size());
}

void OwnedBuffer::drain(size_t size) {
  size = std::min(size, length_);
  length_ -= size;
  while (size > 0 && !slices_.empty()) {
    std::string& front = slices_.front();
    if (front.size() <= size) {
      size -= front.size();
      slices_.pop_front();
    } else {
      front.erase(0, size);
      size = 0;
    }
  }
}

std::string OwnedBuffer::toString() const {
  std::string result;
  result.reserve(length_);
  for (const auto& slice : slices_) {
    result += slice;
  }
  return result;
}

}  // namespace duplex
