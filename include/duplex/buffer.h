#ifndef DUPLEX_BUFFER_H
#define DUPLEX_BUFFER_H

#include <cstddef>
#include <deque>
#include <string>

namespace duplex {

// Byte buffer used for request bodies and response payloads.
class Buffer {
 public:
  virtual ~Buffer() = default;

  virtual void add(const void* data, size_t size) = 0;
  virtual void add(const std::string& data) = 0;

  // Drop |size| bytes from the front, or everything if fewer are held
  virtual void drain(size_t size) = 0;

  virtual size_t length() const = 0;
  bool empty() const { return length() == 0; }

  // Number of separately stored chunks
  virtual size_t sliceCount() const = 0;

  virtual std::string toString() const = 0;
};

// Buffer owning its storage as a queue of slices. Adding never copies
// the slices already held.
class OwnedBuffer : public Buffer {
 public:
  OwnedBuffer() = default;
  explicit OwnedBuffer(const std::string& data);
  OwnedBuffer(const OwnedBuffer&) = delete;
  OwnedBuffer& operator=(const OwnedBuffer&) = delete;
  OwnedBuffer(OwnedBuffer&& other) noexcept;
  OwnedBuffer& operator=(OwnedBuffer&& other) noexcept;
  ~OwnedBuffer() override = default;

  void add(const void* data, size_t size) override;
  void add(const std::string& data) override;
  void drain(size_t size) override;
  size_t length() const override { return length_; }
  size_t sliceCount() const override { return slices_.size(); }
  std::string toString() const override;

 private:
  std::deque<std::string> slices_;
  size_t length_{0};
};

}  // namespace duplex

#endif  // DUPLEX_BUFFER_H
