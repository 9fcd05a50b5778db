/**
 * @file npy_io.cpp
 * @brief Strict NPY parsing and float32 NPY writing for raster frames.
 *
 * Malformed headers, big-endian or Fortran-order payloads, and shapes
 * whose byte size overflows are rejected before any allocation.
 */

#include "npy_io.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace nowcast
{
namespace
{

constexpr std::size_t kMaxHeaderBytes = 1u << 20;

enum class NpyDtype
{
    Float32,
    Float64,
    UInt8,
    UInt16,
    Int16,
    Int32,
};

/** @brief Read exactly `bytes` bytes from a stream into `ptr`. */
bool read_all(std::ifstream& in, void* ptr, std::size_t bytes)
{
    if (bytes == 0)
    {
        return true;
    }
    if (bytes > static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max()))
    {
        return false;
    }

    const std::streamsize count = static_cast<std::streamsize>(bytes);
    in.read(static_cast<char*>(ptr), count);
    return in.gcount() == count;
}

/** @brief Parse a strictly positive decimal integer with bounds checking. */
bool parse_positive_int(const std::string& text, int& out, std::string& error)
{
    errno = 0;
    char* end = nullptr;
    const unsigned long parsed = std::strtoul(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE ||
        parsed == 0 || parsed > static_cast<unsigned long>(std::numeric_limits<int>::max()))
    {
        error = "invalid positive integer in NPY shape: '" + text + "'";
        return false;
    }

    out = static_cast<int>(parsed);
    return true;
}

/** @brief Compute `rows*cols` safely for allocation and payload-size validation. */
bool checked_element_count(int rows, int cols, std::size_t& out, std::string& error)
{
    if (rows <= 0 || cols <= 0)
    {
        error = "NPY shape must be strictly positive";
        return false;
    }

    const std::size_t srows = static_cast<std::size_t>(rows);
    const std::size_t scols = static_cast<std::size_t>(cols);
    if (srows > std::numeric_limits<std::size_t>::max() / scols / sizeof(float))
    {
        error = "NPY shape overflows size_t";
        return false;
    }

    out = srows * scols;
    return true;
}

/** @brief Parse 2D shape tuple from a NPY header dictionary string. */
std::vector<int> parse_shape(const std::string& header, std::string& error)
{
    std::regex shape_re("'shape'\\s*:\\s*\\(([^\\)]*)\\)");
    std::smatch match;

    if (!std::regex_search(header, match, shape_re) || match.size() < 2)
    {
        error = "NPY header missing shape";
        return {};
    }

    const std::string shape_text = match[1].str();
    std::regex num_re("([0-9]+)");
    std::sregex_iterator it(shape_text.begin(), shape_text.end(), num_re);
    const std::sregex_iterator end;

    std::vector<int> dims;
    dims.reserve(2);
    for (; it != end; ++it)
    {
        int dim = 0;
        if (!parse_positive_int((*it)[1].str(), dim, error))
        {
            return {};
        }
        dims.push_back(dim);
    }

    if (dims.size() != 2)
    {
        std::ostringstream oss;
        oss << "Expected 2D array, got " << dims.size() << "D";
        error = oss.str();
        return {};
    }
    return dims;
}

/** @brief Check that `fortran_order` is explicitly `False` in header dict. */
bool header_has_false_fortran(const std::string& header)
{
    std::regex fortran_re("'fortran_order'\\s*:\\s*(True|False)");
    std::smatch match;
    if (!std::regex_search(header, match, fortran_re) || match.size() < 2)
    {
        return false;
    }
    return match[1].str() == "False";
}

/** @brief Map the header dtype descriptor to a supported element type. */
bool header_dtype(const std::string& header, NpyDtype& out)
{
    std::regex descr_re("'descr'\\s*:\\s*'([^']+)'");
    std::smatch match;
    if (!std::regex_search(header, match, descr_re) || match.size() < 2)
    {
        return false;
    }

    const std::string descr = match[1].str();
    if (descr.size() != 3 || (descr[0] != '<' && descr[0] != '=' && descr[0] != '|'))
    {
        return false;
    }

    const std::string kind = descr.substr(1);
    if (descr[0] == '|' && kind != "u1")
    {
        return false;
    }
    if (kind == "f4")
    {
        out = NpyDtype::Float32;
    }
    else if (kind == "f8")
    {
        out = NpyDtype::Float64;
    }
    else if (kind == "u1")
    {
        out = NpyDtype::UInt8;
    }
    else if (kind == "u2")
    {
        out = NpyDtype::UInt16;
    }
    else if (kind == "i2")
    {
        out = NpyDtype::Int16;
    }
    else if (kind == "i4")
    {
        out = NpyDtype::Int32;
    }
    else
    {
        return false;
    }
    return true;
}

/** @brief Read `n` little-endian elements of type `T` and widen them to float. */
template <typename T>
bool read_widened(std::ifstream& in, std::size_t n, std::vector<float>& out, std::string& error)
{
    if (n > std::numeric_limits<std::size_t>::max() / sizeof(T))
    {
        error = "NPY payload size overflows size_t";
        return false;
    }
    std::vector<T> raw(n);
    if (!read_all(in, raw.data(), n * sizeof(T)))
    {
        error = "Failed to read NPY payload data";
        return false;
    }
    for (std::size_t i = 0; i < n; ++i)
    {
        out[i] = static_cast<float>(raw[i]);
    }
    return true;
}

/** @brief Parse/validate NPY header and extract 2D shape and dtype. */
bool read_npy_2d_header(std::ifstream& in,
                        const std::filesystem::path& path,
                        int& rows,
                        int& cols,
                        NpyDtype& dtype,
                        std::string& error)
{
    char magic[6] = {0};
    if (!read_all(in, magic, sizeof(magic)))
    {
        error = "Failed to read NPY magic";
        return false;
    }
    if (std::string(magic, sizeof(magic)) != "\x93NUMPY")
    {
        error = "Invalid NPY magic in " + path.string();
        return false;
    }

    unsigned char major = 0;
    unsigned char minor = 0;
    if (!read_all(in, &major, 1) || !read_all(in, &minor, 1))
    {
        error = "Failed to read NPY version";
        return false;
    }

    std::size_t header_len = 0;
    if (major == 1)
    {
        unsigned char len16[2] = {0, 0};
        if (!read_all(in, len16, sizeof(len16)))
        {
            error = "Failed to read v1 header length";
            return false;
        }
        header_len = static_cast<std::size_t>(len16[0]) | (static_cast<std::size_t>(len16[1]) << 8);
    }
    else if (major == 2 || major == 3)
    {
        unsigned char len32[4] = {0, 0, 0, 0};
        if (!read_all(in, len32, sizeof(len32)))
        {
            error = "Failed to read v2/v3 header length";
            return false;
        }
        header_len = static_cast<std::size_t>(len32[0]) |
                     (static_cast<std::size_t>(len32[1]) << 8) |
                     (static_cast<std::size_t>(len32[2]) << 16) |
                     (static_cast<std::size_t>(len32[3]) << 24);
    }
    else
    {
        std::ostringstream oss;
        oss << "Unsupported NPY version " << static_cast<int>(major) << "." << static_cast<int>(minor);
        error = oss.str();
        return false;
    }

    if (header_len == 0 || header_len > kMaxHeaderBytes)
    {
        error = "NPY header length is invalid or too large";
        return false;
    }

    std::string header(header_len, '\0');
    if (!read_all(in, header.data(), header_len))
    {
        error = "Failed to read NPY header";
        return false;
    }

    if (!header_dtype(header, dtype))
    {
        error = "Unsupported NPY dtype (expected little-endian f4, f8, u1, u2, i2 or i4)";
        return false;
    }
    if (!header_has_false_fortran(header))
    {
        error = "Only C-order NPY arrays are supported";
        return false;
    }

    const std::vector<int> dims = parse_shape(header, error);
    if (dims.empty())
    {
        return false;
    }

    rows = dims[0];
    cols = dims[1];
    return true;
}

} // namespace

bool load_npy_2d(const std::filesystem::path& path, NpyArray2D& out, std::string& error)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        error = "Failed to open file: " + path.string();
        return false;
    }

    NpyDtype dtype = NpyDtype::Float32;
    if (!read_npy_2d_header(in, path, out.rows, out.cols, dtype, error))
    {
        return false;
    }

    std::size_t n = 0;
    if (!checked_element_count(out.rows, out.cols, n, error))
    {
        return false;
    }

    out.data.resize(n);
    if (dtype == NpyDtype::Float32)
    {
        if (!read_all(in, out.data.data(), n * sizeof(float)))
        {
            error = "Failed to read NPY payload data";
            return false;
        }
        return true;
    }

    switch (dtype)
    {
        case NpyDtype::Float64:
            return read_widened<double>(in, n, out.data, error);
        case NpyDtype::UInt8:
            return read_widened<std::uint8_t>(in, n, out.data, error);
        case NpyDtype::UInt16:
            return read_widened<std::uint16_t>(in, n, out.data, error);
        case NpyDtype::Int16:
            return read_widened<std::int16_t>(in, n, out.data, error);
        case NpyDtype::Int32:
            return read_widened<std::int32_t>(in, n, out.data, error);
        case NpyDtype::Float32:
        default:
            break;
    }
    error = "Unsupported NPY dtype";
    return false;
}

bool load_npy_2d_shape(const std::filesystem::path& path, NpyArray2DShape& out, std::string& error)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        error = "Failed to open file: " + path.string();
        return false;
    }

    NpyDtype dtype = NpyDtype::Float32;
    return read_npy_2d_header(in, path, out.rows, out.cols, dtype, error);
}

bool save_npy_float32_2d(const std::filesystem::path& path,
                         int rows,
                         int cols,
                         const std::vector<float>& data,
                         std::string& error)
{
    std::size_t n = 0;
    if (!checked_element_count(rows, cols, n, error))
    {
        return false;
    }
    if (data.size() != n)
    {
        error = "NPY payload size does not match shape";
        return false;
    }

    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            error = "failed to create directory '" + parent.string() + "': " + ec.message();
            return false;
        }
    }

    const std::string header_dict = "{'descr': '<f4', 'fortran_order': False, 'shape': (" +
        std::to_string(rows) + ", " + std::to_string(cols) + "), }";
    std::size_t header_len = header_dict.size() + 1;
    const std::size_t preamble = 6 + 2 + 2;
    const std::size_t padding = (16 - ((preamble + header_len) % 16)) % 16;
    header_len += padding;

    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        error = "Failed to open file for writing: " + path.string();
        return false;
    }

    out.write("\x93NUMPY", 6);
    out.put(static_cast<char>(1));
    out.put(static_cast<char>(0));

    const std::uint16_t hl = static_cast<std::uint16_t>(header_len);
    char lenb[2];
    lenb[0] = static_cast<char>(hl & 0xFF);
    lenb[1] = static_cast<char>((hl >> 8) & 0xFF);
    out.write(lenb, 2);
    out.write(header_dict.c_str(), static_cast<std::streamsize>(header_dict.size()));
    for (std::size_t i = 0; i < padding; ++i)
    {
        out.put(' ');
    }
    out.put('\n');
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size() * sizeof(float)));

    if (!out.good())
    {
        error = "Failed to write NPY payload: " + path.string();
        return false;
    }
    return true;
}

bool load_npy_field(const std::filesystem::path& path, Field2D& out, std::string& error)
{
    NpyArray2D array;
    if (!load_npy_2d(path, array, error))
    {
        return false;
    }
    out = Field2D(array.rows, array.cols, std::move(array.data));
    return true;
}

bool save_npy_field(const std::filesystem::path& path, const Field2D& field, std::string& error)
{
    return save_npy_float32_2d(path, field.rows(), field.cols(), field.values(), error);
}

} // namespace nowcast
