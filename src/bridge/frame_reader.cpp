#include "simb/bridge/frame_reader.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace simb::bridge {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

std::string_view trim(std::string_view text) {
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

// Upper bound on how long the destructor waits for an in-flight upstream read.
constexpr auto kReadDrainTimeout = std::chrono::milliseconds(50);

}  // namespace

// ────────────────────────────────────────────────────────────────
// StreamFrameReader
// ────────────────────────────────────────────────────────────────

std::optional<std::string> StreamFrameReader::next() {
  std::string line;
  while (std::getline(in_, line)) {
    const std::string_view frame = trim(line);
    if (in_.eof()) {
      // getline stopped at end of input, not at a separator.
      if (!frame.empty()) {
        std::cerr << "Dropping incomplete frame at end of input (" << line.size() << " bytes)\n";
      }
      return std::nullopt;
    }
    if (frame.empty()) {
      continue;
    }
    return std::string(frame);
  }
  return std::nullopt;
}

// ────────────────────────────────────────────────────────────────
// QueuedFrameReader
// ────────────────────────────────────────────────────────────────

struct QueuedFrameReader::Shared {
  std::unique_ptr<IFrameSource> upstream;
  std::size_t capacity;

  std::mutex mutex;
  std::condition_variable not_empty;
  std::condition_variable not_full;
  std::condition_variable read_done;
  // A failed upstream read is queued in order and rethrown to the consumer.
  struct Entry {
    std::string frame;
    std::exception_ptr error;
  };
  std::deque<Entry> frames;
  bool closed{false};    // upstream reached end of input
  bool stopping{false};  // consumer is gone
  bool in_read{false};   // reader thread is inside upstream->next()
};

QueuedFrameReader::QueuedFrameReader(std::unique_ptr<IFrameSource> upstream, std::size_t capacity)
    : shared_(std::make_shared<Shared>()) {
  if (!upstream) {
    throw std::invalid_argument("QueuedFrameReader requires an upstream source");
  }
  if (capacity == 0) {
    throw std::invalid_argument("QueuedFrameReader capacity must be positive");
  }
  shared_->upstream = std::move(upstream);
  shared_->capacity = capacity;
  thread_ = std::thread(&QueuedFrameReader::run, shared_);
}

QueuedFrameReader::~QueuedFrameReader() {
  bool blocked_in_read = false;
  {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    shared_->stopping = true;
    shared_->read_done.wait_for(lock, kReadDrainTimeout, [this] { return !shared_->in_read; });
    blocked_in_read = shared_->in_read;
  }
  shared_->not_full.notify_all();

  if (!thread_.joinable()) {
    return;
  }
  if (blocked_in_read) {
    // The thread owns a reference to Shared and exits after its read returns.
    thread_.detach();
  } else {
    thread_.join();
  }
}

std::optional<std::string> QueuedFrameReader::next() {
  std::unique_lock<std::mutex> lock(shared_->mutex);
  shared_->not_empty.wait(lock, [this] { return !shared_->frames.empty() || shared_->closed; });
  if (shared_->frames.empty()) {
    return std::nullopt;
  }
  Shared::Entry entry = std::move(shared_->frames.front());
  shared_->frames.pop_front();
  lock.unlock();
  shared_->not_full.notify_one();
  if (entry.error) {
    std::rethrow_exception(entry.error);
  }
  return std::move(entry.frame);
}

void QueuedFrameReader::run(const std::shared_ptr<Shared>& shared) {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(shared->mutex);
      shared->not_full.wait(lock, [&shared] {
        return shared->stopping || shared->frames.size() < shared->capacity;
      });
      if (shared->stopping) {
        break;
      }
      shared->in_read = true;
    }

    std::optional<std::string> frame;
    std::exception_ptr error;
    try {
      frame = shared->upstream->next();
    } catch (const std::exception& e) {
      std::cerr << "Frame read failed: " << e.what() << "\n";
      error = std::current_exception();
    }

    std::unique_lock<std::mutex> lock(shared->mutex);
    shared->in_read = false;
    shared->read_done.notify_all();
    if (error) {
      // The consumer decides whether to keep reading.
      shared->frames.push_back(Shared::Entry{{}, error});
    } else if (frame.has_value()) {
      shared->frames.push_back(Shared::Entry{std::move(*frame), nullptr});
    } else {
      break;
    }
    lock.unlock();
    shared->not_empty.notify_one();
  }

  {
    std::lock_guard<std::mutex> lock(shared->mutex);
    shared->closed = true;
  }
  shared->not_empty.notify_all();
}

}  // namespace simb::bridge
