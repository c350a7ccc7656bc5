#include "graphics/KittyGraphics.hpp"
#include "graphics/Base64.hpp"
#include <algorithm>

namespace tessera::graphics {

namespace {

constexpr std::string_view APC_START = "\033_G";
constexpr std::string_view APC_END = "\033\\";
constexpr std::string_view QUERY_PROBE = "\033_Gi=31,s=1,v=1,a=q,t=d,f=24;AAAA\033\\";

template <typename T>
void append_key(std::string& out, const char* key, const std::optional<T>& value) {
    if (!value) return;
    out += ',';
    out += key;
    out += '=';
    out += std::to_string(*value);
}

}

void KittyGraphics::write_chunked(const std::vector<uint8_t>& data, const ControlKeys& keys) {
    const std::string encoded = encode_base64(data.data(), data.size());

    size_t offset = 0;
    bool first = true;
    while (offset < encoded.size()) {
        const size_t chunk = std::min(encoded.size() - offset, MAX_CHUNK_SIZE);
        const bool last = offset + chunk >= encoded.size();

        output_ += APC_START;
        if (first) {
            output_ += "a=";
            output_ += keys.action;
            output_ += ",f=";
            output_ += std::to_string(static_cast<int>(keys.format));
            append_key(output_, "s", keys.width);
            append_key(output_, "v", keys.height);
            append_key(output_, "i", keys.image_id);
            append_key(output_, "p", keys.placement_id);
            append_key(output_, "x", keys.x);
            append_key(output_, "y", keys.y);
            append_key(output_, "c", keys.columns);
            append_key(output_, "r", keys.rows);
            append_key(output_, "z", keys.z_index);
            if (keys.no_cursor_move) output_ += ",C=1";
            output_ += ",m=";
            first = false;
        } else {
            // Continuation chunks carry no other keys, so no leading comma
            output_ += "m=";
        }
        output_ += last ? '0' : '1';
        output_ += ';';
        output_.append(encoded, offset, chunk);
        output_ += APC_END;

        offset += chunk;
    }
}

const std::string& KittyGraphics::draw_image(const Image& image, const Placement& placement) {
    output_.clear();

    uint32_t image_id;
    if (placement.image_id) {
        image_id = *placement.image_id;
    } else {
        image_id = next_image_id_++;
    }
    last_image_id_ = image_id;

    const bool raw = image.format() != ImageFormat::Png;
    ControlKeys keys;
    keys.action = 'T';
    keys.format = image.format();
    if (raw) {
        keys.width = image.width();
        keys.height = image.height();
    }
    keys.image_id = image_id;
    keys.placement_id = placement.placement_id;
    keys.x = placement.x;
    keys.y = placement.y;
    keys.columns = placement.width;
    keys.rows = placement.height;
    if (placement.z_index != 0) keys.z_index = placement.z_index;
    keys.no_cursor_move = !placement.move_cursor;

    write_chunked(image.data(), keys);
    return output_;
}

const std::string& KittyGraphics::transmit_image(const Image& image, uint32_t image_id) {
    output_.clear();
    last_image_id_ = image_id;

    ControlKeys keys;
    keys.action = 't';
    keys.format = image.format();
    if (image.format() != ImageFormat::Png) {
        keys.width = image.width();
        keys.height = image.height();
    }
    keys.image_id = image_id;

    write_chunked(image.data(), keys);
    return output_;
}

void KittyGraphics::append_placement_keys(const Placement& placement) {
    append_key(output_, "p", placement.placement_id);
    append_key(output_, "x", placement.x);
    append_key(output_, "y", placement.y);
    append_key(output_, "c", placement.width);
    append_key(output_, "r", placement.height);
    if (placement.z_index != 0) {
        output_ += ",z=" + std::to_string(placement.z_index);
    }
    if (!placement.move_cursor) {
        output_ += ",C=1";
    }
}

const std::string& KittyGraphics::place_image(uint32_t image_id, const Placement& placement) {
    output_.clear();
    output_ += APC_START;
    output_ += "a=p,i=" + std::to_string(image_id);
    append_placement_keys(placement);
    output_ += APC_END;
    return output_;
}

const std::string& KittyGraphics::delete_images(DeleteTarget target, std::optional<uint32_t> id) {
    output_.clear();
    output_ += APC_START;
    output_ += "a=d";

    switch (target) {
        case DeleteTarget::All:
            output_ += ",d=A";
            break;
        case DeleteTarget::ById:
            output_ += ",d=I";
            append_key(output_, "i", id);
            break;
        case DeleteTarget::ByPlacement:
            output_ += ",d=P";
            append_key(output_, "p", id);
            break;
        case DeleteTarget::AtCursor:
            output_ += ",d=C";
            break;
        case DeleteTarget::InRange:
            output_ += ",d=R";
            break;
    }

    output_ += APC_END;
    return output_;
}

const std::string& KittyGraphics::query_support() {
    output_.assign(QUERY_PROBE);
    return output_;
}

Capability KittyGraphics::parse_query_response(std::string_view response) {
    // Success is "i=31;OK", failure carries the error text after the ';'
    Capability cap;

    size_t start = response.find(APC_START);
    if (start == std::string_view::npos) return cap;
    cap.responded = true;

    std::string_view body = response.substr(start + APC_START.size());
    if (body.find(";OK") != std::string_view::npos) {
        cap.supported = true;
        return cap;
    }

    size_t semi = body.find(';');
    if (semi == std::string_view::npos) return cap;
    std::string_view message = body.substr(semi + 1);
    size_t end = message.find(APC_END);
    if (end != std::string_view::npos) {
        cap.error_message = std::string(message.substr(0, end));
    }
    return cap;
}

}  // namespace tessera::graphics
