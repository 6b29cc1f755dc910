#pragma once
/*
 * Hdf5Reader
 *
 * Purpose: IReader over an HDF5 file opened read-only with the HDF5 C API.
 * Note: HDF5 is not thread-safe; callers serialize access (App session mutex).
 * Note: the library's automatic error stack printing is disabled, failures
 * surface as ReadError instead of text on stderr under ncurses.
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "i_reader.hpp"
#include "h5_handle.hpp"

class Hdf5Reader : public IReader {
public:
  Hdf5Reader(const std::filesystem::path& path, std::size_t values_cap);
  ChildInfo describe(const std::string& path) override;
  std::vector<ChildInfo> list_children(const std::string& path) override;
  std::string get_metadata(const std::string& path) override;
  std::string get_attributes(const std::string& path) override;
  std::string get_values(const std::string& path, std::optional<std::uint64_t> start, std::optional<std::uint64_t> end) override;
  DatasetInfo dataset_info(const std::string& path) override;
  std::vector<double> read_numeric(const std::string& path, std::uint64_t start, std::uint64_t end) override;

private:
  H5Handle open_object(const std::string& path) const;
  H5Handle open_dataset(const std::string& path) const;
  // first `head` cells of each row in [start, end), formatted; numbers keep the file type's precision
  std::vector<std::string> read_cells(hid_t dset, hid_t ftype, bool numeric, std::uint64_t start,
                                      std::uint64_t end, std::uint64_t head) const;

  H5Handle file_;
  std::string file_name_;
  std::size_t values_cap_;
};
