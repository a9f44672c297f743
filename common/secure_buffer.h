#ifndef CLIPSYNC_COMMON_SECURE_BUFFER_H
#define CLIPSYNC_COMMON_SECURE_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace clipsync::common {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  volatile std::uint8_t* p = reinterpret_cast<volatile std::uint8_t*>(data);
  while (len--) {
    *p++ = 0;
  }
}

inline void SecureWipe(std::vector<std::uint8_t>& buf) {
  SecureWipe(buf.data(), buf.size());
}

// Wipes a caller-owned temporary on scope exit. The referenced storage must
// not be reallocated while the guard is alive.
class ScopedWipe {
 public:
  explicit ScopedWipe(std::vector<std::uint8_t>& buf)
      : data_(buf.data()), len_(buf.size()) {}

  explicit ScopedWipe(std::string& text)
      : data_(text.empty() ? nullptr : &text[0]), len_(text.size()) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() { SecureWipe(data_, len_); }

 private:
  void* data_{nullptr};
  std::size_t len_{0};
};

// Owning byte buffer for key material. Contents are wiped on reset, on
// move-assignment and on destruction. Not copyable.
class SecureBuffer {
 public:
  SecureBuffer() = default;

  SecureBuffer(const std::uint8_t* data, std::size_t len)
      : data_(data, data + len) {}

  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;

  SecureBuffer(SecureBuffer&& other) noexcept
      : data_(std::move(other.data_)) {
    other.data_.clear();
  }

  SecureBuffer& operator=(SecureBuffer&& other) noexcept {
    if (this == &other) {
      return *this;
    }
    SecureWipe(data_);
    data_ = std::move(other.data_);
    other.data_.clear();
    return *this;
  }

  ~SecureBuffer() { SecureWipe(data_); }

  const std::uint8_t* data() const { return data_.data(); }
  std::size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  void Assign(const std::uint8_t* data, std::size_t len) {
    Reset();
    data_.assign(data, data + len);
  }

  void Reset() {
    SecureWipe(data_);
    data_.clear();
    data_.shrink_to_fit();
  }

 private:
  std::vector<std::uint8_t> data_;
};

}  // namespace clipsync::common

#endif  // CLIPSYNC_COMMON_SECURE_BUFFER_H
