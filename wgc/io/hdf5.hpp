#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/macros.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <hdf5.h>

// =============================================================================
// FILE: wgc/io/hdf5.hpp
// BRIEF: RAII wrapper over the HDF5 C API used by checkpoint files
// =============================================================================

namespace wgc::io::h5 {

namespace detail {

template <typename T>
inline constexpr bool unsupported_type_v = false;

template <typename T>
inline hid_t native_type() {
    if constexpr (std::is_same_v<T, float>)              return H5T_NATIVE_FLOAT;
    else if constexpr (std::is_same_v<T, double>)        return H5T_NATIVE_DOUBLE;
    else if constexpr (std::is_same_v<T, std::int32_t>)  return H5T_NATIVE_INT32;
    else if constexpr (std::is_same_v<T, std::int64_t>)  return H5T_NATIVE_INT64;
    else if constexpr (std::is_same_v<T, std::uint8_t>)  return H5T_NATIVE_UINT8;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return H5T_NATIVE_UINT32;
    else if constexpr (std::is_same_v<T, std::uint64_t>) return H5T_NATIVE_UINT64;
    else static_assert(unsupported_type_v<T>, "Unsupported HDF5 element type");
}

// Turns a negative status into IOError carrying the HDF5 error stack.
inline void check_h5(herr_t err, const std::string& context) {
    if (WGC_LIKELY(err >= 0)) {
        return;
    }
    std::string msg = "HDF5: " + context;

    herr_t walk_err = H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD,
        [](unsigned, const H5E_error2_t* e, void* data) -> herr_t {
            auto* out = static_cast<std::string*>(data);
            if (e->desc) {
                *out += "\n  ";
                *out += e->desc;
            }
            return 0;
        }, &msg);
    if (walk_err < 0) {
        msg += " (error stack unavailable)";
    }
    H5Eclear2(H5E_DEFAULT);

    throw IOError(msg);
}

inline void check_id(hid_t id, const std::string& context) {
    if (WGC_UNLIKELY(id < 0)) {
        check_h5(-1, context);
    }
}

// The library prints its error stack to stderr by default; errors are
// reported through exceptions instead.
inline void silence_auto_print() noexcept {
    static const bool done = [] {
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
        return true;
    }();
    (void)done;
}

} // namespace detail

// =============================================================================
// Object
// =============================================================================

class Object {
public:
    virtual ~Object() noexcept { close(); }

    Object(Object&& other) noexcept : id_(other.id_), closer_(other.closer_) {
        other.id_ = H5I_INVALID_HID;
        other.closer_ = nullptr;
    }

    Object& operator=(Object&& other) noexcept {
        if (this != &other) {
            close();
            id_ = other.id_;
            closer_ = other.closer_;
            other.id_ = H5I_INVALID_HID;
            other.closer_ = nullptr;
        }
        return *this;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    void close() noexcept {
        if (is_valid() && closer_) {
            closer_(id_);
        }
        id_ = H5I_INVALID_HID;
        closer_ = nullptr;
    }

    WGC_NODISCARD hid_t id() const noexcept { return id_; }
    WGC_NODISCARD bool is_valid() const noexcept { return id_ >= 0; }

protected:
    Object() noexcept = default;
    Object(hid_t id, herr_t (*closer)(hid_t)) noexcept : id_(id), closer_(closer) {}

    hid_t id_ = H5I_INVALID_HID;             // NOLINT(*-non-private-member-variables-in-classes)
    herr_t (*closer_)(hid_t) = nullptr;      // NOLINT(*-non-private-member-variables-in-classes)
};

// =============================================================================
// Dataspace / Datatype
// =============================================================================

class Dataspace : public Object {
public:
    explicit Dataspace(const std::vector<hsize_t>& dims)
        : Object(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr), H5Sclose) {
        detail::check_id(id_, "H5Screate_simple");
    }

    static Dataspace scalar() {
        hid_t id = H5Screate(H5S_SCALAR);
        detail::check_id(id, "H5Screate(SCALAR)");
        return Dataspace(id);
    }

    static Dataspace adopt(hid_t id) { return Dataspace(id); }

    std::vector<hsize_t> dims() const {
        const int rank = H5Sget_simple_extent_ndims(id_);
        detail::check_h5(rank, "H5Sget_simple_extent_ndims");
        std::vector<hsize_t> out(static_cast<size_t>(rank));
        if (rank > 0) {
            detail::check_h5(H5Sget_simple_extent_dims(id_, out.data(), nullptr),
                             "H5Sget_simple_extent_dims");
        }
        return out;
    }

    WGC_NODISCARD hsize_t num_elements() const {
        const hssize_t n = H5Sget_simple_extent_npoints(id_);
        detail::check_h5(n < 0 ? -1 : 0, "H5Sget_simple_extent_npoints");
        return static_cast<hsize_t>(n);
    }

private:
    explicit Dataspace(hid_t id) : Object(id, H5Sclose) {}
};

class Datatype : public Object {
public:
    static Datatype string_fixed(size_t len) {
        hid_t id = H5Tcopy(H5T_C_S1);
        detail::check_id(id, "H5Tcopy(H5T_C_S1)");
        Datatype out(id);
        detail::check_h5(H5Tset_size(id, len), "H5Tset_size");
        return out;
    }

    static Datatype adopt(hid_t id) { return Datatype(id); }

    WGC_NODISCARD size_t size() const { return H5Tget_size(id_); }

private:
    explicit Datatype(hid_t id) : Object(id, H5Tclose) {}
};

// =============================================================================
// Attribute
// =============================================================================

class Attribute : public Object {
public:
    static Attribute open(hid_t loc, const std::string& name) {
        hid_t id = H5Aopen(loc, name.c_str(), H5P_DEFAULT);
        detail::check_id(id, "H5Aopen: " + name);
        return Attribute(id);
    }

    static Attribute create(hid_t loc, const std::string& name, hid_t type, const Dataspace& space) {
        hid_t id = H5Acreate2(loc, name.c_str(), type, space.id(), H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Acreate: " + name);
        return Attribute(id);
    }

    template <typename T>
    T read_scalar() const {
        T value{};
        detail::check_h5(H5Aread(id_, detail::native_type<T>(), &value), "H5Aread");
        return value;
    }

    template <typename T>
    void write_scalar(const T& value) {
        detail::check_h5(H5Awrite(id_, detail::native_type<T>(), &value), "H5Awrite");
    }

    // Fixed-length strings only; that is all write_attr_string produces.
    std::string read_string() const {
        hid_t tid = H5Aget_type(id_);
        detail::check_id(tid, "H5Aget_type");
        Datatype type = Datatype::adopt(tid);

        std::string value(type.size(), '\0');
        detail::check_h5(H5Aread(id_, type.id(), value.data()), "H5Aread string");
        const auto nul = value.find('\0');
        if (nul != std::string::npos) {
            value.resize(nul);
        }
        return value;
    }

private:
    explicit Attribute(hid_t id) : Object(id, H5Aclose) {}
};

// =============================================================================
// Dataset creation properties
// =============================================================================

class DatasetCreateProps : public Object {
public:
    DatasetCreateProps() : Object(H5Pcreate(H5P_DATASET_CREATE), H5Pclose) {
        detail::check_id(id_, "H5Pcreate(DATASET_CREATE)");
    }

    DatasetCreateProps& chunked(const std::vector<hsize_t>& chunk_dims) {
        detail::check_h5(H5Pset_chunk(id_, static_cast<int>(chunk_dims.size()), chunk_dims.data()),
                         "H5Pset_chunk");
        return *this;
    }

    // Shuffle + deflate when the library was built with zlib; no-op otherwise.
    DatasetCreateProps& compress(unsigned level = 4) {
        if (H5Zfilter_avail(H5Z_FILTER_DEFLATE) > 0) {
            detail::check_h5(H5Pset_shuffle(id_), "H5Pset_shuffle");
            detail::check_h5(H5Pset_deflate(id_, level), "H5Pset_deflate");
        }
        return *this;
    }
};

// =============================================================================
// Dataset
// =============================================================================

class Dataset : public Object {
public:
    static Dataset open(hid_t loc, const std::string& name) {
        hid_t id = H5Dopen2(loc, name.c_str(), H5P_DEFAULT);
        detail::check_id(id, "H5Dopen: " + name);
        return Dataset(id, name);
    }

    template <typename T>
    static Dataset create(hid_t loc, const std::string& name,
                          const std::vector<hsize_t>& dims,
                          const DatasetCreateProps& props = DatasetCreateProps()) {
        Dataspace space(dims);
        hid_t id = H5Dcreate2(loc, name.c_str(), detail::native_type<T>(), space.id(),
                              H5P_DEFAULT, props.id(), H5P_DEFAULT);
        detail::check_id(id, "H5Dcreate: " + name);
        return Dataset(id, name);
    }

    std::vector<hsize_t> dims() const {
        hid_t sid = H5Dget_space(id_);
        detail::check_id(sid, "H5Dget_space: " + name_);
        return Dataspace::adopt(sid).dims();
    }

    WGC_NODISCARD hsize_t num_elements() const {
        hid_t sid = H5Dget_space(id_);
        detail::check_id(sid, "H5Dget_space: " + name_);
        return Dataspace::adopt(sid).num_elements();
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(H5Dwrite(id_, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
                         "H5Dwrite: " + name_);
    }

    /// @throws DimensionError if `out` does not match the stored element count
    template <typename T>
    void read(Array<T> out) const {
        const hsize_t n = num_elements();
        if (n != static_cast<hsize_t>(out.size())) {
            throw DimensionError("Dataset " + name_ + " holds " + std::to_string(n) +
                                 " elements, expected " + std::to_string(out.size()));
        }
        if (n == 0) {
            return;
        }
        detail::check_h5(H5Dread(id_, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()),
                         "H5Dread: " + name_);
    }

private:
    Dataset(hid_t id, std::string name) : Object(id, H5Dclose), name_(std::move(name)) {}

    std::string name_;
};

// =============================================================================
// File
// =============================================================================

class File : public Object {
public:
    /// Open an existing file. @throws IOError
    explicit File(const std::string& path, unsigned flags = H5F_ACC_RDONLY) {
        detail::silence_auto_print();
        id_ = H5Fopen(path.c_str(), flags, H5P_DEFAULT);
        closer_ = H5Fclose;
        detail::check_id(id_, "H5Fopen: " + path);
    }

    /// Create a new file. H5F_ACC_EXCL refuses to replace an existing one.
    static File create(const std::string& path, unsigned flags = H5F_ACC_EXCL) {
        detail::silence_auto_print();
        hid_t id = H5Fcreate(path.c_str(), flags, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Fcreate: " + path);
        return File(id);
    }

    void flush() {
        detail::check_h5(H5Fflush(id_, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

    // -------------------------------------------------------------------------
    // Root attributes
    // -------------------------------------------------------------------------

    WGC_NODISCARD bool has_attr(const std::string& name) const {
        const htri_t r = H5Aexists(id_, name.c_str());
        detail::check_h5(r < 0 ? -1 : 0, "H5Aexists: " + name);
        return r > 0;
    }

    WGC_NODISCARD bool exists(const std::string& name) const {
        const htri_t r = H5Lexists(id_, name.c_str(), H5P_DEFAULT);
        detail::check_h5(r < 0 ? -1 : 0, "H5Lexists: " + name);
        return r > 0;
    }

    template <typename T>
    void write_attr(const std::string& name, const T& value) {
        Dataspace space = Dataspace::scalar();
        Attribute::create(id_, name, detail::native_type<T>(), space).write_scalar(value);
    }

    template <typename T>
    WGC_NODISCARD T read_attr(const std::string& name) const {
        return Attribute::open(id_, name).read_scalar<T>();
    }

    void write_attr_string(const std::string& name, const std::string& value) {
        Dataspace space = Dataspace::scalar();
        Datatype type = Datatype::string_fixed(value.size() + 1);
        Attribute attr = Attribute::create(id_, name, type.id(), space);
        detail::check_h5(H5Awrite(attr.id(), type.id(), value.c_str()), "H5Awrite string: " + name);
    }

    WGC_NODISCARD std::string read_attr_string(const std::string& name) const {
        return Attribute::open(id_, name).read_string();
    }

    // -------------------------------------------------------------------------
    // Datasets
    // -------------------------------------------------------------------------

    template <typename T>
    void write_dataset(const std::string& name, const T* data, const std::vector<hsize_t>& dims,
                       const DatasetCreateProps& props = DatasetCreateProps()) {
        Dataset dset = Dataset::create<T>(id_, name, dims, props);
        hsize_t total = 1;
        for (hsize_t d : dims) total *= d;
        if (total > 0) {
            dset.write(data);
        }
    }

    Dataset open_dataset(const std::string& name) const {
        return Dataset::open(id_, name);
    }

private:
    explicit File(hid_t id) : Object(id, H5Fclose) {}
};

} // namespace wgc::io::h5
