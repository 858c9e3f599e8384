#include "database/npy_io.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <cstring>

namespace facevault {

namespace {

constexpr unsigned char NPY_MAGIC[] = {0x93, 'N', 'U', 'M', 'P', 'Y'};
constexpr size_t NPY_MAGIC_LEN = sizeof(NPY_MAGIC);

// valor de una clave del header: {'descr': '<f8', 'fortran_order': False, 'shape': (128,), }
std::string header_field(const std::string& header, const std::string& key) {
    auto k = header.find("'" + key + "'");
    if (k == std::string::npos) return "";
    auto colon = header.find(':', k);
    if (colon == std::string::npos) return "";

    auto start = header.find_first_not_of(' ', colon + 1);
    if (start == std::string::npos) return "";

    char open = header[start];
    if (open == '\'') {
        auto end = header.find('\'', start + 1);
        return end == std::string::npos ? "" : header.substr(start + 1, end - start - 1);
    }
    if (open == '(') {
        auto end = header.find(')', start);
        return end == std::string::npos ? "" : header.substr(start + 1, end - start - 1);
    }
    auto end = header.find_first_of(",}", start);
    return header.substr(start, end - start);
}

}  // namespace

// ==================== ENCODE ====================

Bytes encode_npy(const Embedding& embedding) {
    std::string header = "{'descr': '<f8', 'fortran_order': False, 'shape': (" +
                         std::to_string(embedding.size()) + ",), }";

    // magic(6) + version(2) + header_len(2) + header + '\n' alineado a 64
    size_t prefix = NPY_MAGIC_LEN + 2 + 2;
    size_t total = prefix + header.size() + 1;
    size_t padding = (64 - total % 64) % 64;
    header.append(padding, ' ');
    header.push_back('\n');

    Bytes out;
    out.reserve(prefix + header.size() + embedding.size() * sizeof(double));
    out.insert(out.end(), NPY_MAGIC, NPY_MAGIC + NPY_MAGIC_LEN);
    out.push_back(1);
    out.push_back(0);

    uint16_t hlen = static_cast<uint16_t>(header.size());
    out.push_back(static_cast<unsigned char>(hlen & 0xff));
    out.push_back(static_cast<unsigned char>((hlen >> 8) & 0xff));
    out.insert(out.end(), header.begin(), header.end());

    for (float v : embedding) {
        double d = static_cast<double>(v);
        unsigned char raw[sizeof(double)];
        std::memcpy(raw, &d, sizeof(double));
        out.insert(out.end(), raw, raw + sizeof(double));
    }
    return out;
}

// ==================== DECODE ====================

std::optional<Embedding> decode_npy(const Bytes& data) {
    if (data.size() < NPY_MAGIC_LEN + 4 ||
        std::memcmp(data.data(), NPY_MAGIC, NPY_MAGIC_LEN) != 0) {
        return std::nullopt;
    }

    unsigned char major = data[NPY_MAGIC_LEN];
    size_t header_len = 0;
    size_t offset = 0;
    if (major == 1) {
        header_len = data[8] | (data[9] << 8);
        offset = 10;
    } else if (major == 2 || major == 3) {
        if (data.size() < 12) return std::nullopt;
        header_len = data[8] | (data[9] << 8) | (data[10] << 16) |
                     (static_cast<size_t>(data[11]) << 24);
        offset = 12;
    } else {
        return std::nullopt;
    }

    if (data.size() < offset + header_len) return std::nullopt;
    std::string header(data.begin() + offset, data.begin() + offset + header_len);
    offset += header_len;

    std::string descr = header_field(header, "descr");
    std::string fortran = header_field(header, "fortran_order");
    std::string shape = header_field(header, "shape");

    if (fortran.find("True") != std::string::npos) return std::nullopt;

    // shape "128," -> un solo eje
    size_t count = 0;
    try {
        auto comma = shape.find(',');
        std::string first = trim_copy(shape.substr(0, comma));
        std::string rest = comma == std::string::npos ? "" : trim_copy(shape.substr(comma + 1));
        if (first.empty() || !rest.empty()) return std::nullopt;
        count = std::stoul(first);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    size_t item = 0;
    if (descr == "<f8") item = sizeof(double);
    else if (descr == "<f4") item = sizeof(float);
    else return std::nullopt;

    if (data.size() < offset + count * item) return std::nullopt;

    Embedding emb(count);
    for (size_t i = 0; i < count; ++i) {
        const unsigned char* p = data.data() + offset + i * item;
        if (item == sizeof(double)) {
            double d;
            std::memcpy(&d, p, sizeof(double));
            emb[i] = static_cast<float>(d);
        } else {
            std::memcpy(&emb[i], p, sizeof(float));
        }
    }
    return emb;
}

// ==================== FILES ====================

void save_npy(const std::filesystem::path& path, const Embedding& embedding) {
    write_file_bytes(path, encode_npy(embedding));
}

std::optional<Embedding> load_npy(const std::filesystem::path& path) {
    auto data = read_file_bytes(path);
    if (!data) return std::nullopt;

    auto emb = decode_npy(*data);
    if (!emb) {
        spdlog::warn("Formato .npy no soportado: {}", path.string());
    }
    return emb;
}

}  // namespace facevault
