#pragma once
/*
 * H5Handle
 *
 * Purpose: RAII owner of an HDF5 identifier; the opener picks the close function
 * (H5Fclose, H5Oclose, H5Dclose, H5Sclose, H5Tclose, H5Aclose, H5Pclose).
 */
#include <hdf5.h>

class H5Handle {
public:
  using Closer = herr_t (*)(hid_t);
  H5Handle() = default;
  H5Handle(hid_t id, Closer close) : id_(id), close_(close) {}
  H5Handle(const H5Handle&) = delete;
  H5Handle& operator=(const H5Handle&) = delete;
  H5Handle(H5Handle&& other) noexcept : id_(other.id_), close_(other.close_) { other.id_ = -1; }
  H5Handle& operator=(H5Handle&& other) noexcept {
    if (this != &other) { close_if_needed(); id_ = other.id_; close_ = other.close_; other.id_ = -1; }
    return *this;
  }
  ~H5Handle() { close_if_needed(); }
  hid_t get() const { return id_; }
  bool valid() const { return id_ >= 0; }
private:
  void close_if_needed() { if (id_ >= 0 && close_) { close_(id_); id_ = -1; } }
  hid_t id_ = -1;
  Closer close_ = nullptr;
};
