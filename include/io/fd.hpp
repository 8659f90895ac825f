#pragma once

namespace luasync {

// Owning wrapper for a POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    // Closes the descriptor and reports close(2) failure as -1 with errno set.
    int Close();

  private:
    int fd_{-1};
};

} // namespace luasync
