#include "hdf5_reader.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <sstream>

static constexpr size_t ROW_CELL_CAP = 32;
static constexpr size_t ATTR_CELL_CAP = 16;

static std::string last_component(const std::string& path) {
  size_t pos = path.find_last_of('/');
  if (pos == std::string::npos) return path;
  return path.substr(pos + 1);
}

static herr_t collect_link_name(hid_t, const char* name, const H5L_info_t*, void* op_data) {
  static_cast<std::vector<std::string>*>(op_data)->emplace_back(name);
  return 0;
}

static herr_t collect_attr_name(hid_t, const char* name, const H5A_info_t*, void* op_data) {
  static_cast<std::vector<std::string>*>(op_data)->emplace_back(name);
  return 0;
}

static std::vector<std::string> attribute_names(hid_t obj) {
  std::vector<std::string> names;
  hsize_t idx = 0;
  if (H5Aiterate2(obj, H5_INDEX_NAME, H5_ITER_INC, &idx, collect_attr_name, &names) < 0)
    throw ReadError("cannot iterate attributes");
  return names;
}

static hsize_t link_count(hid_t group) {
  H5G_info_t info{};
  if (H5Gget_info(group, &info) < 0) throw ReadError("cannot read group info");
  return info.nlinks;
}

static bool is_numeric_type(hid_t type) {
  H5T_class_t c = H5Tget_class(type);
  return c == H5T_INTEGER || c == H5T_FLOAT;
}

static std::string dtype_name(hid_t type) {
  size_t bits = H5Tget_size(type) * 8;
  switch (H5Tget_class(type)) {
    case H5T_INTEGER:
      return std::string(H5Tget_sign(type) == H5T_SGN_NONE ? "uint" : "int") + std::to_string(bits);
    case H5T_FLOAT: return "float" + std::to_string(bits);
    case H5T_STRING:
      if (H5Tis_variable_str(type) > 0) return "string (variable length)";
      return "string (" + std::to_string(H5Tget_size(type)) + " bytes)";
    case H5T_COMPOUND: return "compound (" + std::to_string(H5Tget_nmembers(type)) + " members)";
    case H5T_ENUM: return "enum";
    case H5T_BITFIELD: return "bitfield";
    case H5T_OPAQUE: return "opaque";
    case H5T_REFERENCE: return "reference";
    case H5T_ARRAY: return "array";
    case H5T_VLEN: return "vlen";
    case H5T_TIME: return "time";
    default: return "unknown";
  }
}

static int precision_for(hid_t type) {
  return (H5Tget_class(type) == H5T_FLOAT && H5Tget_size(type) <= 4) ? 7 : 15;
}

static std::string format_number(double v, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
  return buf;
}

static std::string format_bytes(std::uint64_t n) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double v = static_cast<double>(n);
  int u = 0;
  while (v >= 1024.0 && u < 4) { v /= 1024.0; u++; }
  char buf[64];
  if (u == 0) std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(n));
  else std::snprintf(buf, sizeof(buf), "%.2f %s", v, units[u]);
  return buf;
}

static std::vector<hsize_t> dims_of(hid_t space) {
  int rank = H5Sget_simple_extent_ndims(space);
  if (rank < 0) throw ReadError("cannot read dataspace");
  std::vector<hsize_t> dims(static_cast<size_t>(rank));
  if (rank > 0 && H5Sget_simple_extent_dims(space, dims.data(), nullptr) < 0) throw ReadError("cannot read dataspace");
  return dims;
}

template <typename T>
static std::string tuple_text(const std::vector<T>& v) {
  std::string s = "(";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) s += ", ";
    s += std::to_string(v[i]);
  }
  if (v.size() == 1) s += ",";
  return s + ")";
}

// selects first-axis rows [start, start + rows) of fspace, returns the matching memory space
static H5Handle select_rows(hid_t fspace, const std::vector<hsize_t>& dims, hsize_t start, hsize_t rows) {
  std::vector<hsize_t> offset(dims.size(), 0);
  std::vector<hsize_t> count(dims);
  offset[0] = start;
  count[0] = rows;
  if (H5Sselect_hyperslab(fspace, H5S_SELECT_SET, offset.data(), nullptr, count.data(), nullptr) < 0)
    throw ReadError("cannot select rows");
  H5Handle mem(H5Screate_simple(static_cast<int>(count.size()), count.data(), nullptr), H5Sclose);
  if (!mem.valid()) throw ReadError("cannot create memory dataspace");
  return mem;
}

// point-selects the first `head` elements (row-major) of each first-axis row in [start, start + rows);
// the matching memory space is one-dimensional
static H5Handle select_row_heads(hid_t fspace, const std::vector<hsize_t>& dims, hsize_t start, hsize_t rows, hsize_t head) {
  size_t rank = dims.size();
  std::vector<hsize_t> coords;
  coords.reserve(static_cast<size_t>(rows * head) * rank);
  std::vector<hsize_t> idx(rank, 0);
  for (hsize_t r = 0; r < rows; ++r) {
    std::fill(idx.begin(), idx.end(), 0);
    idx[0] = start + r;
    for (hsize_t k = 0; k < head; ++k) {
      coords.insert(coords.end(), idx.begin(), idx.end());
      for (size_t d = rank - 1; d > 0; --d) {
        if (++idx[d] < dims[d]) break;
        idx[d] = 0;
      }
    }
  }
  hsize_t npoints = rows * head;
  if (H5Sselect_elements(fspace, H5S_SELECT_SET, static_cast<size_t>(npoints), coords.data()) < 0)
    throw ReadError("cannot select row cells");
  H5Handle mem(H5Screate_simple(1, &npoints, nullptr), H5Sclose);
  if (!mem.valid()) throw ReadError("cannot create memory dataspace");
  return mem;
}

static std::string attribute_value_text(hid_t attr) {
  H5Handle ftype(H5Aget_type(attr), H5Tclose);
  H5Handle space(H5Aget_space(attr), H5Sclose);
  if (!ftype.valid() || !space.valid()) throw ReadError("cannot inspect attribute");
  hssize_t npoints = H5Sget_simple_extent_npoints(space.get());
  if (npoints < 0) throw ReadError("cannot inspect attribute");
  size_t n = static_cast<size_t>(npoints);
  std::vector<std::string> cells;
  if (is_numeric_type(ftype.get())) {
    std::vector<double> buf(n);
    if (n > 0 && H5Aread(attr, H5T_NATIVE_DOUBLE, buf.data()) < 0) throw ReadError("cannot read attribute");
    int prec = precision_for(ftype.get());
    for (double v : buf) cells.push_back(format_number(v, prec));
  } else if (H5Tget_class(ftype.get()) == H5T_STRING) {
    H5Handle mtype(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_cset(mtype.get(), H5Tget_cset(ftype.get()));
    if (H5Tis_variable_str(ftype.get()) > 0) {
      H5Tset_size(mtype.get(), H5T_VARIABLE);
      std::vector<char*> buf(n, nullptr);
      if (n > 0 && H5Aread(attr, mtype.get(), buf.data()) < 0) throw ReadError("cannot read attribute");
      for (char* p : buf) cells.emplace_back(p ? p : "");
      if (n > 0) H5Dvlen_reclaim(mtype.get(), space.get(), H5P_DEFAULT, buf.data());
    } else {
      size_t size = H5Tget_size(ftype.get());
      H5Tset_size(mtype.get(), size);
      std::vector<char> buf(n * size);
      if (n > 0 && H5Aread(attr, mtype.get(), buf.data()) < 0) throw ReadError("cannot read attribute");
      for (size_t i = 0; i < n; ++i) {
        const char* p = buf.data() + i * size;
        cells.emplace_back(p, strnlen(p, size));
      }
    }
  } else {
    return "<" + dtype_name(ftype.get()) + ">";
  }
  if (cells.size() == 1) return cells[0];
  std::string s = "[";
  for (size_t i = 0; i < cells.size() && i < ATTR_CELL_CAP; ++i) {
    if (i) s += ", ";
    s += cells[i];
  }
  if (cells.size() > ATTR_CELL_CAP) s += ", ...";
  return s + "]";
}

Hdf5Reader::Hdf5Reader(const std::filesystem::path& path, std::size_t values_cap)
    : values_cap_(values_cap) {
  H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
  file_ = H5Handle(H5Fopen(path.string().c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose);
  if (!file_.valid()) throw ReadError("cannot open HDF5 file: " + path.string());
  file_name_ = path.filename().string();
  spdlog::info("opened {}", path.string());
}

H5Handle Hdf5Reader::open_object(const std::string& path) const {
  H5Handle obj(H5Oopen(file_.get(), path.c_str(), H5P_DEFAULT), H5Oclose);
  if (!obj.valid()) throw ReadError("cannot open " + path);
  return obj;
}

H5Handle Hdf5Reader::open_dataset(const std::string& path) const {
  H5Handle dset(H5Dopen2(file_.get(), path.c_str(), H5P_DEFAULT), H5Dclose);
  if (!dset.valid()) throw ReadError(path + " is not a Dataset");
  return dset;
}

ChildInfo Hdf5Reader::describe(const std::string& path) {
  H5Handle obj = open_object(path);
  ChildInfo info;
  info.name = (path == "/") ? file_name_ : last_component(path);
  if (H5Iget_type(obj.get()) == H5I_GROUP) {
    info.kind = NodeKind::Container;
    info.has_children = link_count(obj.get()) > 0;
  }
  return info;
}

std::vector<ChildInfo> Hdf5Reader::list_children(const std::string& path) {
  H5Handle group = open_object(path);
  if (H5Iget_type(group.get()) != H5I_GROUP) throw ReadError(path + " is not a Group");
  std::vector<std::string> names;
  hsize_t idx = 0;
  if (H5Literate(group.get(), H5_INDEX_NAME, H5_ITER_INC, &idx, collect_link_name, &names) < 0)
    throw ReadError("cannot list children of " + path);
  std::vector<ChildInfo> out;
  out.reserve(names.size());
  for (const auto& name : names) {
    H5Handle child(H5Oopen(group.get(), name.c_str(), H5P_DEFAULT), H5Oclose);
    if (!child.valid()) {
      // dangling soft or external link
      spdlog::warn("skipping unresolvable link {}", join_path(path, name));
      continue;
    }
    ChildInfo ci;
    ci.name = name;
    if (H5Iget_type(child.get()) == H5I_GROUP) {
      ci.kind = NodeKind::Container;
      ci.has_children = link_count(child.get()) > 0;
    }
    out.push_back(std::move(ci));
  }
  spdlog::debug("listed {} children of {}", out.size(), path);
  return out;
}

std::string Hdf5Reader::get_metadata(const std::string& path) {
  H5Handle obj = open_object(path);
  std::string name = (path == "/") ? file_name_ : last_component(path);
  size_t nattrs = attribute_names(obj.get()).size();
  std::ostringstream oss;
  H5I_type_t type = H5Iget_type(obj.get());
  if (type == H5I_GROUP) {
    oss << "Group:          " << name << "\n"
        << "Path:           " << path << "\n"
        << "N_children:     " << link_count(obj.get()) << "\n"
        << "N_attributes:   " << nattrs;
    return oss.str();
  }
  if (type != H5I_DATASET) {
    oss << "Object:         " << name << "\n"
        << "Path:           " << path << "\n"
        << "N_attributes:   " << nattrs;
    return oss.str();
  }
  H5Handle dset = open_dataset(path);
  H5Handle ftype(H5Dget_type(dset.get()), H5Tclose);
  H5Handle space(H5Dget_space(dset.get()), H5Sclose);
  H5Handle dcpl(H5Dget_create_plist(dset.get()), H5Pclose);
  if (!ftype.valid() || !space.valid() || !dcpl.valid()) throw ReadError("cannot inspect " + path);
  std::vector<hsize_t> dims = dims_of(space.get());
  hssize_t npoints = H5Sget_simple_extent_npoints(space.get());

  std::string chunks = "None";
  if (H5Pget_layout(dcpl.get()) == H5D_CHUNKED) {
    std::vector<hsize_t> cdims(dims.size());
    if (H5Pget_chunk(dcpl.get(), static_cast<int>(cdims.size()), cdims.data()) >= 0) chunks = tuple_text(cdims);
  }
  std::string compression;
  int nfilters = H5Pget_nfilters(dcpl.get());
  for (int i = 0; i < nfilters; ++i) {
    unsigned flags = 0, config = 0;
    size_t nelmts = 4;
    unsigned cd_values[4] = {0, 0, 0, 0};
    char fname[64] = {0};
    H5Z_filter_t filter = H5Pget_filter2(dcpl.get(), static_cast<unsigned>(i), &flags, &nelmts, cd_values, sizeof(fname), fname, &config);
    if (!compression.empty()) compression += ", ";
    if (filter == H5Z_FILTER_DEFLATE) compression += "gzip(" + std::to_string(nelmts > 0 ? cd_values[0] : 0) + ")";
    else if (filter == H5Z_FILTER_SHUFFLE) compression += "shuffle";
    else if (filter == H5Z_FILTER_FLETCHER32) compression += "fletcher32";
    else if (filter == H5Z_FILTER_SZIP) compression += "szip";
    else compression += fname[0] ? fname : ("filter " + std::to_string(filter));
  }
  if (compression.empty()) compression = "None";

  oss << "Dataset:        " << name << "\n"
      << "Path:           " << path << "\n"
      << "Shape:          " << tuple_text(dims) << "\n"
      << "Datatype:       " << dtype_name(ftype.get()) << "\n"
      << "Size:           " << (npoints < 0 ? 0 : npoints) << " elements\n"
      << "Memory:         " << format_bytes(H5Dget_storage_size(dset.get())) << "\n"
      << "Chunks:         " << chunks << "\n"
      << "Compression:    " << compression << "\n"
      << "N_attributes:   " << nattrs;
  return oss.str();
}

std::string Hdf5Reader::get_attributes(const std::string& path) {
  H5Handle obj = open_object(path);
  std::vector<std::string> names = attribute_names(obj.get());
  if (names.empty()) return "No attributes";
  std::string out;
  for (const auto& name : names) {
    H5Handle attr(H5Aopen(obj.get(), name.c_str(), H5P_DEFAULT), H5Aclose);
    if (!attr.valid()) throw ReadError("cannot open attribute " + name + " of " + path);
    if (!out.empty()) out += '\n';
    out += name + ": " + attribute_value_text(attr.get());
  }
  return out;
}

DatasetInfo Hdf5Reader::dataset_info(const std::string& path) {
  H5Handle dset = open_dataset(path);
  H5Handle ftype(H5Dget_type(dset.get()), H5Tclose);
  H5Handle space(H5Dget_space(dset.get()), H5Sclose);
  if (!ftype.valid() || !space.valid()) throw ReadError("cannot inspect " + path);
  DatasetInfo info;
  for (hsize_t d : dims_of(space.get())) info.shape.push_back(static_cast<std::uint64_t>(d));
  info.dtype = dtype_name(ftype.get());
  info.numeric = is_numeric_type(ftype.get());
  return info;
}

std::vector<double> Hdf5Reader::read_numeric(const std::string& path, std::uint64_t start, std::uint64_t end) {
  H5Handle dset = open_dataset(path);
  H5Handle ftype(H5Dget_type(dset.get()), H5Tclose);
  if (!ftype.valid() || !is_numeric_type(ftype.get())) throw ReadError(path + " is not numeric");
  H5Handle fspace(H5Dget_space(dset.get()), H5Sclose);
  if (!fspace.valid()) throw ReadError("cannot inspect " + path);
  std::vector<hsize_t> dims = dims_of(fspace.get());
  if (dims.empty()) {
    if (start > 0 || end == 0) return {};
    double v = 0;
    if (H5Dread(dset.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &v) < 0) throw ReadError("cannot read " + path);
    return {v};
  }
  end = std::min<std::uint64_t>(end, dims[0]);
  if (start >= end) return {};
  hsize_t rows = end - start;
  hsize_t row_size = 1;
  for (size_t i = 1; i < dims.size(); ++i) row_size *= dims[i];
  std::vector<double> out(static_cast<size_t>(rows * row_size));
  if (out.empty()) return out;
  H5Handle mem = select_rows(fspace.get(), dims, start, rows);
  if (H5Dread(dset.get(), H5T_NATIVE_DOUBLE, mem.get(), fspace.get(), H5P_DEFAULT, out.data()) < 0)
    throw ReadError("cannot read " + path);
  return out;
}

std::vector<std::string> Hdf5Reader::read_cells(hid_t dset, hid_t ftype, bool numeric, std::uint64_t start,
                                                std::uint64_t end, std::uint64_t head) const {
  H5Handle fspace(H5Dget_space(dset), H5Sclose);
  if (!fspace.valid()) throw ReadError("cannot read dataspace");
  std::vector<hsize_t> dims = dims_of(fspace.get());
  H5Handle mem;
  hid_t mem_id = H5S_ALL, file_sel = H5S_ALL;
  size_t total = 1;
  if (!dims.empty()) {
    end = std::min<std::uint64_t>(end, dims[0]);
    if (start >= end) return {};
    hsize_t rows = end - start;
    hsize_t row_size = 1;
    for (size_t i = 1; i < dims.size(); ++i) row_size *= dims[i];
    if (row_size == 0) return {};
    if (head >= row_size) {
      total = static_cast<size_t>(rows * row_size);
      mem = select_rows(fspace.get(), dims, start, rows);
    } else {
      total = static_cast<size_t>(rows * head);
      mem = select_row_heads(fspace.get(), dims, start, rows, head);
    }
    mem_id = mem.get();
    file_sel = fspace.get();
  }
  std::vector<std::string> out;
  out.reserve(total);
  if (numeric) {
    std::vector<double> buf(total);
    if (H5Dread(dset, H5T_NATIVE_DOUBLE, mem_id, file_sel, H5P_DEFAULT, buf.data()) < 0) throw ReadError("cannot read values");
    int prec = precision_for(ftype);
    for (double v : buf) out.push_back(format_number(v, prec));
    return out;
  }
  H5Handle mtype(H5Tcopy(H5T_C_S1), H5Tclose);
  H5Tset_cset(mtype.get(), H5Tget_cset(ftype));
  if (H5Tis_variable_str(ftype) > 0) {
    H5Tset_size(mtype.get(), H5T_VARIABLE);
    std::vector<char*> buf(total, nullptr);
    if (H5Dread(dset, mtype.get(), mem_id, file_sel, H5P_DEFAULT, buf.data()) < 0) throw ReadError("cannot read strings");
    for (char* p : buf) out.emplace_back(p ? p : "");
    H5Dvlen_reclaim(mtype.get(), mem.valid() ? mem.get() : fspace.get(), H5P_DEFAULT, buf.data());
  } else {
    size_t size = H5Tget_size(ftype);
    H5Tset_size(mtype.get(), size);
    std::vector<char> buf(total * size);
    if (H5Dread(dset, mtype.get(), mem_id, file_sel, H5P_DEFAULT, buf.data()) < 0) throw ReadError("cannot read strings");
    for (size_t i = 0; i < total; ++i) {
      const char* p = buf.data() + i * size;
      out.emplace_back(p, strnlen(p, size));
    }
  }
  return out;
}

std::string Hdf5Reader::get_values(const std::string& path, std::optional<std::uint64_t> start, std::optional<std::uint64_t> end) {
  DatasetInfo info = dataset_info(path);
  std::uint64_t n = info.length();
  std::uint64_t row = std::max<std::uint64_t>(1, info.row_size());
  std::uint64_t s = start.value_or(0);
  std::uint64_t window = std::max<std::uint64_t>(1, values_cap_ / row);
  std::uint64_t e = end ? std::min(*end, n) : std::min<std::uint64_t>(n, s + window);
  if (s >= e) return std::string();
  if (!info.shape.empty() && info.row_size() == 0) {
    std::string out;
    for (std::uint64_t r = s; r < e; ++r) out += (r > s ? "\n[]" : "[]");
    return out;
  }
  H5Handle dset = open_dataset(path);
  H5Handle ftype(H5Dget_type(dset.get()), H5Tclose);
  if (!ftype.valid()) throw ReadError("cannot inspect " + path);
  if (!info.numeric && H5Tget_class(ftype.get()) != H5T_STRING) {
    throw ReadError("cannot display values of type " + info.dtype);
  }
  // only the cells shown per row are read
  std::uint64_t head = std::min<std::uint64_t>(row, ROW_CELL_CAP);
  std::vector<std::string> cells = read_cells(dset.get(), ftype.get(), info.numeric, s, e, head);
  std::string out;
  for (size_t r = 0; (r + 1) * head <= cells.size(); ++r) {
    if (r) out += '\n';
    if (row == 1) { out += cells[r]; continue; }
    out += '[';
    for (size_t k = 0; k < head; ++k) {
      if (k) out += ", ";
      out += cells[r * head + k];
    }
    if (row > ROW_CELL_CAP) out += ", ...";
    out += ']';
  }
  return out;
}
