#include "clam/io/dataset_loader.hpp"
#include "clam/error.hpp"
#include "clam/logging.hpp"

#include <bit>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace clam {
namespace io {

namespace {

std::ifstream open_input(const std::string& path, std::ios::openmode mode = std::ios::in) {
    std::ifstream in(path, mode);
    if (!in) {
        throw IOError("Cannot open file", path, "Check that the path exists and is readable");
    }
    return in;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    const size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    const size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string location(const std::string& path, size_t line) {
    return path + ":" + std::to_string(line);
}

std::string stem_of(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

// =============================================================================
// NPY header
// =============================================================================

struct NpyHeader {
    std::string descr;
    bool fortran_order = false;
    std::vector<size_t> shape;
};

// Value following 'key': in the header dictionary
std::string header_field(const std::string& header, const std::string& key, const std::string& path) {
    const std::string quoted = "'" + key + "'";
    size_t pos = header.find(quoted);
    if (pos == std::string::npos) {
        throw ParseError("NPY header has no '" + key + "' entry", path);
    }
    pos = header.find(':', pos + quoted.size());
    if (pos == std::string::npos) {
        throw ParseError("Malformed NPY header near '" + key + "'", path);
    }
    return trim(header.substr(pos + 1));
}

NpyHeader parse_npy_header(const std::string& header, const std::string& path) {
    NpyHeader parsed;

    std::string descr = header_field(header, "descr", path);
    if (descr.size() < 2 || descr[0] != '\'') {
        throw ParseError("Malformed NPY descr", path);
    }
    parsed.descr = descr.substr(1, descr.find('\'', 1) - 1);

    const std::string order = header_field(header, "fortran_order", path);
    parsed.fortran_order = order.rfind("True", 0) == 0;

    const std::string shape = header_field(header, "shape", path);
    if (shape.empty() || shape[0] != '(') {
        throw ParseError("Malformed NPY shape", path);
    }
    const size_t close = shape.find(')');
    std::stringstream dims(shape.substr(1, close - 1));
    std::string dim;
    while (std::getline(dims, dim, ',')) {
        dim = trim(dim);
        if (dim.empty()) continue;
        try {
            parsed.shape.push_back(static_cast<size_t>(std::stoull(dim)));
        } catch (const std::exception&) {
            throw ParseError("Invalid NPY dimension '" + dim + "'", path);
        }
    }
    return parsed;
}

} // namespace

// =============================================================================
// Loaders
// =============================================================================

std::vector<DenseVector> load_dense_csv(const std::string& path, char delimiter) {
    std::ifstream in = open_input(path);

    std::vector<DenseVector> rows;
    std::string line;
    size_t line_number = 0;
    size_t dimensionality = 0;

    while (std::getline(in, line)) {
        ++line_number;
        const std::string content = trim(line);
        if (content.empty() || content[0] == '#') continue;

        DenseVector row;
        std::stringstream fields(content);
        std::string field;
        while (std::getline(fields, field, delimiter)) {
            field = trim(field);
            char* end = nullptr;
            errno = 0;
            const float value = std::strtof(field.c_str(), &end);
            if (field.empty() || end != field.c_str() + field.size() || errno == ERANGE) {
                throw ParseError("Invalid numeric field '" + field + "'", location(path, line_number));
            }
            row.push_back(value);
        }

        if (rows.empty()) {
            dimensionality = row.size();
        } else if (row.size() != dimensionality) {
            throw ParseError("Row has " + std::to_string(row.size()) + " columns, expected " +
                             std::to_string(dimensionality), location(path, line_number));
        }
        rows.push_back(std::move(row));
    }

    LOG_DEBUG("Loaded ", rows.size(), " rows of dimension ", dimensionality, " from ", path);
    return rows;
}

std::vector<DenseVector> load_npy(const std::string& path) {
    if constexpr (std::endian::native != std::endian::little) {
        throw IOError("NPY loading requires a little-endian host", path, "", ErrorCode::IO_FAILURE);
    }

    std::ifstream in = open_input(path, std::ios::binary);

    char magic[6];
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, "\x93NUMPY", 6) != 0) {
        throw ParseError("Not an NPY file (bad magic)", path);
    }

    uint8_t version[2] = {0, 0};
    in.read(reinterpret_cast<char*>(version), 2);

    uint32_t header_length = 0;
    if (version[0] == 1) {
        uint16_t length16 = 0;
        in.read(reinterpret_cast<char*>(&length16), 2);
        header_length = length16;
    } else if (version[0] == 2 || version[0] == 3) {
        in.read(reinterpret_cast<char*>(&header_length), 4);
    } else {
        throw ParseError("Unsupported NPY version " + std::to_string(version[0]), path);
    }

    std::string header(header_length, '\0');
    in.read(header.data(), header_length);
    if (!in) {
        throw ParseError("Truncated NPY header", path);
    }

    const NpyHeader parsed = parse_npy_header(header, path);
    if (parsed.fortran_order) {
        throw ParseError("Fortran-ordered NPY arrays are not supported", path);
    }
    if (parsed.shape.size() != 2) {
        throw ParseError("Expected a 2-D array, got " + std::to_string(parsed.shape.size()) + " dimensions", path);
    }
    if (parsed.descr != "<f4" && parsed.descr != "<f8") {
        throw ParseError("Unsupported dtype '" + parsed.descr + "'", path, "Use float32 or float64");
    }

    const size_t rows = parsed.shape[0];
    const size_t cols = parsed.shape[1];
    const size_t item_size = parsed.descr == "<f4" ? sizeof(float) : sizeof(double);

    // The header's shape is checked against the bytes on disk before allocating
    constexpr size_t max_size = std::numeric_limits<size_t>::max();
    if ((cols != 0 && rows > max_size / cols) || (rows * cols > max_size / item_size)) {
        throw ParseError("NPY shape (" + std::to_string(rows) + ", " + std::to_string(cols) +
                         ") overflows the addressable size", path);
    }
    const size_t expected_bytes = rows * cols * item_size;

    std::error_code ec;
    const uintmax_t file_bytes = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IOError("Cannot stat NPY file: " + ec.message(), path, "", ErrorCode::IO_FAILURE);
    }
    const std::streamoff data_offset = in.tellg();
    const uintmax_t available = data_offset >= 0 && file_bytes > static_cast<uintmax_t>(data_offset)
        ? file_bytes - static_cast<uintmax_t>(data_offset)
        : 0;
    if (expected_bytes > available) {
        throw ParseError("Truncated NPY data: shape (" + std::to_string(rows) + ", " +
                         std::to_string(cols) + ") needs " + std::to_string(expected_bytes) +
                         " bytes, file holds " + std::to_string(available), path);
    }

    std::vector<DenseVector> data(rows, DenseVector(cols));

    if (parsed.descr == "<f4") {
        for (auto& row : data) {
            in.read(reinterpret_cast<char*>(row.data()), static_cast<std::streamsize>(cols * sizeof(float)));
        }
    } else {
        std::vector<double> buffer(cols);
        for (auto& row : data) {
            in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(cols * sizeof(double)));
            for (size_t c = 0; c < cols; ++c) {
                row[c] = static_cast<float>(buffer[c]);
            }
        }
    }

    if (!in) {
        throw ParseError("Truncated NPY data: expected " + std::to_string(rows) + "x" +
                         std::to_string(cols) + " values", path);
    }

    LOG_DEBUG("Loaded ", rows, "x", cols, " ", parsed.descr, " array from ", path);
    return data;
}

std::vector<DenseVector> load_dense(const std::string& path) {
    const std::string extension = std::filesystem::path(path).extension().string();
    if (extension == ".npy") return load_npy(path);
    if (extension == ".tsv") return load_dense_csv(path, '\t');
    return load_dense_csv(path, ',');
}

std::vector<std::string> load_strings(const std::string& path) {
    std::ifstream in = open_input(path);

    std::vector<std::string> instances;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        instances.push_back(std::move(line));
    }
    return instances;
}

std::shared_ptr<const DenseDataset> load_dense_dataset(const std::string& path) {
    return std::make_shared<const DenseDataset>(load_dense(path), stem_of(path));
}

std::shared_ptr<const StringDataset> load_string_dataset(const std::string& path) {
    return std::make_shared<const StringDataset>(load_strings(path), stem_of(path));
}

} // namespace io
} // namespace clam
