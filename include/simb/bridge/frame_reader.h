#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace simb::bridge {

// IFrameSource yields complete frames, one per call, until input ends.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  // Blocks until a frame is available. nullopt means end of input; it is sticky.
  [[nodiscard]] virtual std::optional<std::string> next() = 0;

 protected:
  IFrameSource() = default;
  IFrameSource(const IFrameSource&) = default;
  IFrameSource& operator=(const IFrameSource&) = default;
  IFrameSource(IFrameSource&&) = default;
  IFrameSource& operator=(IFrameSource&&) = default;
};

// StreamFrameReader splits an istream on '\n'.
// Frames are trimmed of surrounding whitespace (including a trailing '\r');
// whitespace-only lines are skipped. A final line without a terminating '\n'
// is incomplete and is dropped.
class StreamFrameReader final : public IFrameSource {
 public:
  explicit StreamFrameReader(std::istream& in) : in_(in) {}

  [[nodiscard]] std::optional<std::string> next() override;

 private:
  std::istream& in_;
};

// QueuedFrameReader moves the blocking read onto a background thread that fills a
// bounded queue; the reader thread waits while the queue is full.
// An exception from the upstream read is rethrown by next() in frame order and
// the reader thread keeps reading.
// On destruction the thread is joined, or detached if it is still blocked inside
// the upstream read (a pipe the parent has not closed).
class QueuedFrameReader final : public IFrameSource {
 public:
  QueuedFrameReader(std::unique_ptr<IFrameSource> upstream, std::size_t capacity);
  ~QueuedFrameReader() override;

  QueuedFrameReader(const QueuedFrameReader&) = delete;
  QueuedFrameReader& operator=(const QueuedFrameReader&) = delete;
  QueuedFrameReader(QueuedFrameReader&&) = delete;
  QueuedFrameReader& operator=(QueuedFrameReader&&) = delete;

  [[nodiscard]] std::optional<std::string> next() override;

 private:
  struct Shared;

  static void run(const std::shared_ptr<Shared>& shared);

  std::shared_ptr<Shared> shared_;
  std::thread thread_;
};

}  // namespace simb::bridge
