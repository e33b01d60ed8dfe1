#include "record_layout.hpp"
#include "util.hpp"
#include "errors.hpp"
#include <cstring>

namespace {

void put_double(std::string& out, double v) {
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    util::put_u64(out, bits);
}

double get_double(const char* p) {
    uint64_t bits = util::get_u64(p);
    double v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

void encode_common(const Bar& bar, std::string& out) {
    util::put_u64(out, static_cast<uint64_t>(bar.timestamp));
    put_double(out, bar.open);
    put_double(out, bar.high);
    put_double(out, bar.low);
    put_double(out, bar.close);
    util::put_u64(out, static_cast<uint64_t>(bar.volume));
}

Bar decode_common(const char* p) {
    Bar bar;
    bar.timestamp = static_cast<int64_t>(util::get_u64(p));
    bar.open = get_double(p + 8);
    bar.high = get_double(p + 16);
    bar.low = get_double(p + 24);
    bar.close = get_double(p + 32);
    bar.volume = static_cast<int64_t>(util::get_u64(p + 40));
    return bar;
}

} // namespace

void EquityLayout::encode(const Bar& bar, std::string& out) const {
    encode_common(bar, out);
}

Bar EquityLayout::decode(const char* p) const {
    return decode_common(p);
}

void DerivativeLayout::encode(const Bar& bar, std::string& out) const {
    encode_common(bar, out);
    util::put_u64(out, static_cast<uint64_t>(bar.open_interest));
}

Bar DerivativeLayout::decode(const char* p) const {
    Bar bar = decode_common(p);
    bar.open_interest = static_cast<int64_t>(util::get_u64(p + 48));
    return bar;
}

namespace layout {

RecordLayout for_segment(Segment segment) {
    if (schema::carries_open_interest(segment)) {
        return DerivativeLayout{};
    }
    return EquityLayout{};
}

std::size_t record_size(const RecordLayout& layout) {
    return std::visit([](const auto& l) { return l.kRecordSize; }, layout);
}

std::string encode(const RecordLayout& layout, const std::vector<Bar>& bars) {
    return std::visit([&bars](const auto& l) {
        std::string out;
        out.reserve(bars.size() * l.kRecordSize);
        for (const auto& bar : bars) {
            l.encode(bar, out);
        }
        return out;
    }, layout);
}

std::vector<Bar> decode(const RecordLayout& layout, const std::string& bytes) {
    return std::visit([&bytes](const auto& l) {
        if (bytes.size() % l.kRecordSize != 0) {
            throw StorageIntegrityError("Record section size " + std::to_string(bytes.size()) +
                                        " is not a multiple of " + std::to_string(l.kRecordSize));
        }
        std::vector<Bar> bars;
        bars.reserve(bytes.size() / l.kRecordSize);
        for (std::size_t off = 0; off < bytes.size(); off += l.kRecordSize) {
            bars.push_back(l.decode(bytes.data() + off));
        }
        return bars;
    }, layout);
}

} // namespace layout
