#ifndef YARDSTICK_SUITES_ALIGNED_BUFFER_HPP
#define YARDSTICK_SUITES_ALIGNED_BUFFER_HPP
/**
 * @file AlignedBuffer.hpp
 * @brief Owning page-aligned byte buffer for memory and disk probes.
 * @note NOT RT-safe: Allocates.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib> // posix_memalign, free
#include <memory>

namespace yardstick {

namespace suites {

/// Default alignment (page size; satisfies O_DIRECT).
inline constexpr std::size_t BUFFER_ALIGNMENT = 4096;

/**
 * @brief posix_memalign allocation released on destruction.
 */
class AlignedBuffer {
public:
  AlignedBuffer() = default;

  /**
   * @brief Allocate `size` bytes aligned to `alignment`.
   * @note Check valid(); allocation failure leaves the buffer empty.
   */
  explicit AlignedBuffer(std::size_t size, std::size_t alignment = BUFFER_ALIGNMENT) noexcept {
    void* ptr = nullptr;
    if (size > 0 && ::posix_memalign(&ptr, alignment, size) == 0) {
      data_.reset(static_cast<std::uint8_t*>(ptr));
      size_ = size;
    }
  }

  [[nodiscard]] bool valid() const noexcept { return data_ != nullptr; }
  [[nodiscard]] std::uint8_t* data() noexcept { return data_.get(); }
  [[nodiscard]] const std::uint8_t* data() const noexcept { return data_.get(); }
  [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
  struct FreeDeleter {
    void operator()(std::uint8_t* p) const noexcept { std::free(p); }
  };

  std::unique_ptr<std::uint8_t, FreeDeleter> data_{};
  std::size_t size_{0};
};

} // namespace suites

} // namespace yardstick

#endif // YARDSTICK_SUITES_ALIGNED_BUFFER_HPP
