#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace brickfinder::core {

/// Monotonic clock used for capture times, stability windows and batching.
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// One captured video frame: dimensions, format, owned pixel buffer, plus the
/// capture sequence number and capture time.
/// Frames travel capture -> queue -> inference worker by move; a Frame is never
/// shared between threads.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer,
        std::uint64_t seq = 0,
        Timestamp captured_at = {})
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)),
        seq_(seq),
        captured_at_(captured_at) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint64_t seq() const noexcept { return seq_; }
  [[nodiscard]] Timestamp captured_at() const noexcept { return captured_at_; }

  void set_seq(std::uint64_t seq) noexcept { seq_ = seq; }
  void set_captured_at(Timestamp t) noexcept { captured_at_ = t; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when the buffer holds at least min_bytes() for the declared geometry.
  [[nodiscard]] bool is_valid() const noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

  [[nodiscard]] static std::size_t channels(PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
  std::uint64_t seq_{0};
  Timestamp captured_at_{};
};

}  // namespace brickfinder::core
