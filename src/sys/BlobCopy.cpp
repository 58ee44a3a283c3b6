#include "sys/BlobCopy.hpp"
#include "build/Errors.hpp"
#include "util/Units.hpp"

#include <liburing.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace gadgetimg::sys {

namespace fs = std::filesystem;

static constexpr size_t kChunk = util::MiB(1);

namespace {

class Fd {
public:
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { if (fd_ >= 0) ::close(fd_); }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;
  [[nodiscard]] int get() const { return fd_; }
  // close(2) result for the write side, where a late error still matters.
  int release_close() { int r = ::close(fd_); fd_ = -1; return r; }

private:
  int fd_;
};

[[noreturn]] void io_failure(const char* what, const fs::path& src, const fs::path& dst, int err) {
  throw build::ExternalToolFailure({"copy_blob", src.string(), dst.string()}, err,
                                   std::string(what) + ": " + std::strerror(err));
}

// One SQE submitted and reaped synchronously. Returns cqe->res.
int submit_and_wait(struct io_uring& ring) {
  int rc = io_uring_submit(&ring);
  if (rc < 0) return rc;
  struct io_uring_cqe* cqe = nullptr;
  do {
    rc = io_uring_wait_cqe(&ring, &cqe);
  } while (rc == -EINTR);
  if (rc < 0) return rc;
  int res = cqe->res;
  io_uring_cqe_seen(&ring, cqe);
  return res;
}

uint64_t copy_uring(struct io_uring& ring, int in, int out, uint64_t offset, uint64_t length,
                    const fs::path& src, const fs::path& dst) {
  std::vector<char> buf(kChunk);
  uint64_t done = 0;
  while (done < length) {
    auto want = static_cast<unsigned>(std::min<uint64_t>(kChunk, length - done));
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_read(sqe, in, buf.data(), want, done);
    int got = submit_and_wait(ring);
    if (got == -EINTR || got == -EAGAIN) continue;
    if (got < 0) io_failure("read", src, dst, -got);
    if (got == 0) break;

    int written = 0;
    while (written < got) {
      sqe = io_uring_get_sqe(&ring);
      io_uring_prep_write(sqe, out, buf.data() + written, static_cast<unsigned>(got - written),
                          offset + done + static_cast<uint64_t>(written));
      int w = submit_and_wait(ring);
      if (w == -EINTR || w == -EAGAIN) continue;
      if (w < 0) io_failure("write", src, dst, -w);
      if (w == 0) io_failure("write", src, dst, EIO);
      written += w;
    }
    done += static_cast<uint64_t>(got);
  }
  return done;
}

uint64_t copy_pread(int in, int out, uint64_t offset, uint64_t length,
                    const fs::path& src, const fs::path& dst) {
  std::vector<char> buf(kChunk);
  uint64_t done = 0;
  while (done < length) {
    size_t want = static_cast<size_t>(std::min<uint64_t>(kChunk, length - done));
    ssize_t got = ::pread(in, buf.data(), want, static_cast<off_t>(done));
    if (got < 0) {
      if (errno == EINTR) continue;
      io_failure("read", src, dst, errno);
    }
    if (got == 0) break;
    ssize_t written = 0;
    while (written < got) {
      ssize_t w = ::pwrite(out, buf.data() + written, static_cast<size_t>(got - written),
                           static_cast<off_t>(offset + done + static_cast<uint64_t>(written)));
      if (w < 0) {
        if (errno == EINTR) continue;
        io_failure("write", src, dst, errno);
      }
      written += w;
    }
    done += static_cast<uint64_t>(got);
  }
  return done;
}

} // namespace

uint64_t copy_blob(const fs::path& src, const fs::path& dst, uint64_t offset, uint64_t length,
                   util::Logger& log) {
  Fd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
  if (in.get() < 0) io_failure("open source", src, dst, errno);
  Fd out(::open(dst.c_str(), O_WRONLY | O_CLOEXEC));
  if (out.get() < 0) io_failure("open destination", src, dst, errno);

  uint64_t copied = 0;
  struct io_uring ring{};
  int rc = io_uring_queue_init(4, &ring, 0);
  if (rc < 0) {
    log.warn("io_uring unavailable (%s), copying %s with pread/pwrite", std::strerror(-rc), src.c_str());
    copied = copy_pread(in.get(), out.get(), offset, length, src, dst);
  } else {
    try {
      copied = copy_uring(ring, in.get(), out.get(), offset, length, src, dst);
    } catch (...) {
      io_uring_queue_exit(&ring);
      throw;
    }
    io_uring_queue_exit(&ring);
  }

  if (::fsync(out.get()) != 0) io_failure("fsync", src, dst, errno);
  if (out.release_close() != 0) io_failure("close", src, dst, errno);
  log.debug("copied %llu bytes of %s to %s at offset %llu",
            static_cast<unsigned long long>(copied), src.c_str(), dst.c_str(),
            static_cast<unsigned long long>(offset));
  return copied;
}

} // namespace gadgetimg::sys
