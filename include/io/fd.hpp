#pragma once

namespace isoboot {

// Owns a file descriptor and closes it on destruction.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd);
    // Gives up ownership without closing.
    int Release();
    // Returns the close(2) result so writers can surface deferred errors.
    int Close();

  private:
    int fd_{-1};
};

} // namespace isoboot
