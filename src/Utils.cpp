#include "Utils.hpp"
#include <algorithm>
#include <charconv>

namespace filepush {

Utils::SizeField Utils::encodeSize(uint64_t size) {
    SizeField field;
    for (size_t i = 0; i < field.size(); ++i) {
        field[field.size() - 1 - i] = static_cast<uint8_t>(size >> (8 * i));
    }
    return field;
}

uint64_t Utils::decodeSize(const SizeField& field) {
    uint64_t size = 0;
    for (uint8_t byte : field) {
        size = (size << 8) | byte;
    }
    return size;
}

Utils::NameField Utils::padName(std::string_view name) {
    if (name.size() > protocol::NAME_FIELD_BYTES) {
        throw TransferError(ErrorCode::NameTooLong,
            "File name is " + std::to_string(name.size()) + " bytes, limit is " +
            std::to_string(protocol::NAME_FIELD_BYTES));
    }
    if (name.empty()) {
        throw TransferError(ErrorCode::InvalidParameter, "File name is empty");
    }
    if (name.find('\0') != std::string_view::npos) {
        throw TransferError(ErrorCode::InvalidParameter, "File name contains a NUL byte");
    }

    NameField field{};
    std::copy(name.begin(), name.end(), field.begin());
    return field;
}

std::string Utils::stripName(const NameField& field) {
    size_t length = field.size();
    while (length > 0 && field[length - 1] == 0) {
        --length;
    }
    return std::string(field.begin(), field.begin() + length);
}

bool Utils::isValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        uint8_t lead = static_cast<uint8_t>(text[i]);
        size_t extra;
        uint32_t codepoint;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codepoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codepoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codepoint = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cont = static_cast<uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            codepoint = (codepoint << 6) | (cont & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range code points
        static constexpr uint32_t MIN_FOR_LENGTH[] = {0, 0x80, 0x800, 0x10000};
        if (codepoint < MIN_FOR_LENGTH[extra]) return false;
        if (codepoint >= 0xD800 && codepoint <= 0xDFFF) return false;
        if (codepoint > 0x10FFFF) return false;

        i += extra + 1;
    }
    return true;
}

bool Utils::isPlainFileName(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string_view::npos;
}

uint16_t Utils::validatePort(std::string_view portText) {
    unsigned int port = 0;
    auto [end, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (portText.empty() || ec != std::errc() || end != portText.data() + portText.size() ||
        port > 65535) {
        throw TransferError(ErrorCode::InvalidParameter,
            "Invalid port number: " + std::string(portText));
    }
    return static_cast<uint16_t>(port);
}

std::chrono::seconds Utils::parseTimeout(std::string_view secondsText) {
    unsigned long long secs = 0;
    auto [end, ec] = std::from_chars(secondsText.data(),
        secondsText.data() + secondsText.size(), secs);
    if (secondsText.empty() || ec != std::errc() ||
        end != secondsText.data() + secondsText.size() || secs == 0) {
        throw TransferError(ErrorCode::InvalidParameter,
            "Timeout must be a positive number of seconds: " + std::string(secondsText));
    }
    if (secs > static_cast<unsigned long long>(protocol::MAX_TIMEOUT.count())) {
        throw TransferError(ErrorCode::InvalidParameter,
            "Timeout exceeds " + std::to_string(protocol::MAX_TIMEOUT.count()) + " seconds");
    }
    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(secs));
}

Endpoint Utils::parseEndpoint(std::string_view text, bool allowBarePort) {
    size_t colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        if (!allowBarePort) {
            throw TransferError(ErrorCode::InvalidParameter,
                "Expected HOST:PORT, got: " + std::string(text));
        }
        return Endpoint{"0.0.0.0", validatePort(text)};
    }

    std::string host(text.substr(0, colon));
    if (host.empty()) {
        throw TransferError(ErrorCode::InvalidParameter,
            "Missing host in: " + std::string(text));
    }
    return Endpoint{host, validatePort(text.substr(colon + 1))};
}

} // namespace filepush
