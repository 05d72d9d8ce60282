#include "envelope_yaml.hpp"
#include "base64.hpp"
#include "container.hpp"
#include "symmetric.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <stdexcept>

namespace dycrypt {
namespace envelope {

// ── Emission ──────────────────────────────────────────────────────────────────

// Base64 wrapped at 64 chars with no trailing newline, so yaml-cpp picks '|-'
// for multi-line values and a plain scalar otherwise.
static void emit_b64_key(YAML::Emitter& out, const char* key,
                         const std::vector<uint8_t>& data)
{
    std::string b64 = base64_encode(data);
    out << YAML::Key << key << YAML::Value;
    if (b64.size() <= 64) {
        out << b64;
        return;
    }

    std::string wrapped;
    wrapped.reserve(b64.size() + b64.size() / 64);
    for (size_t i = 0; i < b64.size(); i += 64) {
        if (i > 0) wrapped += '\n';
        wrapped += b64.substr(i, 64);
    }
    out << YAML::Literal << wrapped;
}

std::string emit_yaml(const CascadeResult& data) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    out << YAML::Key << "version" << YAML::Value << ENVELOPE_VERSION;
    out << YAML::Key << "type"    << YAML::Value << ENVELOPE_TYPE;

    emit_b64_key(out, "salt1",      data.salt1);
    emit_b64_key(out, "salt2",      data.salt2);
    emit_b64_key(out, "iv1",        data.iv1);
    emit_b64_key(out, "iv2",        data.iv2);
    emit_b64_key(out, "authTag1",   data.tag1);
    emit_b64_key(out, "authTag2",   data.tag2);
    emit_b64_key(out, "ciphertext", data.ciphertext);

    out << YAML::EndMap;
    out << YAML::EndDoc;

    if (!out.good())
        throw std::runtime_error("envelope: YAML emitter error: " + out.GetLastError());
    return std::string(out.c_str()) + "\n";
}

// ── Parsing ───────────────────────────────────────────────────────────────────

static std::vector<uint8_t> require_b64(const YAML::Node& doc, const char* key) {
    YAML::Node node = doc[key];
    if (!node || !node.IsScalar())
        throw std::runtime_error(std::string("envelope: missing '") + key + "'");
    try {
        return base64_decode(node.as<std::string>());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("envelope: '") + key + "': " + e.what());
    }
}

CascadeResult parse_yaml(const std::string& text) {
    YAML::Node doc;
    try {
        doc = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("envelope: ") + e.what());
    }
    if (!doc.IsMap())
        throw std::runtime_error("envelope: top-level node must be a map");

    std::string doc_type = doc["type"].as<std::string>("");
    if (doc_type != ENVELOPE_TYPE)
        throw std::runtime_error("envelope: 'type' field must be '" +
                                 std::string(ENVELOPE_TYPE) + "' (got '" + doc_type + "')");

    int version = doc["version"].as<int>(ENVELOPE_VERSION);
    if (version != ENVELOPE_VERSION)
        throw std::runtime_error("envelope: unsupported version " + std::to_string(version));

    CascadeResult out;
    out.salt1      = require_b64(doc, "salt1");
    out.salt2      = require_b64(doc, "salt2");
    out.iv1        = require_b64(doc, "iv1");
    out.iv2        = require_b64(doc, "iv2");
    out.tag1       = require_b64(doc, "authTag1");
    out.tag2       = require_b64(doc, "authTag2");
    out.ciphertext = require_b64(doc, "ciphertext");
    return out;
}

bool is_envelope(const std::vector<uint8_t>& bytes) {
    // A binary container starts with a random salt, so a YAML document marker
    // followed by the type tag near the top is not going to occur by chance.
    if (bytes.size() < 3 || bytes[0] != '-' || bytes[1] != '-' || bytes[2] != '-')
        return false;
    std::string head(bytes.begin(),
                     bytes.begin() + static_cast<std::ptrdiff_t>(std::min<size_t>(bytes.size(), 128)));
    return head.find(ENVELOPE_TYPE) != std::string::npos;
}

// ── Loading and inspection ────────────────────────────────────────────────────

CascadeResult load(const std::vector<uint8_t>& raw) {
    if (is_envelope(raw))
        return parse_yaml(std::string(raw.begin(), raw.end()));
    return container::unpack(raw);
}

std::string describe(const std::string& file, const std::vector<uint8_t>& raw) {
    bool yaml = is_envelope(raw);
    CascadeResult data = load(raw);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "file"        << YAML::Value << file;
    out << YAML::Key << "format"      << YAML::Value << (yaml ? "yaml" : "bin");
    out << YAML::Key << "size"        << YAML::Value << raw.size();
    out << YAML::Key << "layer1"      << YAML::Value << YAML::BeginMap
        << YAML::Key << "cipher" << YAML::Value << AES_256_GCM_NAME
        << YAML::Key << "salt"   << YAML::Value << base64_encode(data.salt1)
        << YAML::Key << "iv"     << YAML::Value << base64_encode(data.iv1)
        << YAML::Key << "tag"    << YAML::Value << base64_encode(data.tag1)
        << YAML::EndMap;
    out << YAML::Key << "layer2"      << YAML::Value << YAML::BeginMap
        << YAML::Key << "cipher" << YAML::Value << CHACHA20_POLY1305_NAME
        << YAML::Key << "salt"   << YAML::Value << base64_encode(data.salt2)
        << YAML::Key << "iv"     << YAML::Value << base64_encode(data.iv2)
        << YAML::Key << "tag"    << YAML::Value << base64_encode(data.tag2)
        << YAML::EndMap;
    out << YAML::Key << "payload_len" << YAML::Value << data.ciphertext.size();
    out << YAML::EndMap;

    if (!out.good())
        throw std::runtime_error("inspect: YAML emitter error: " + out.GetLastError());
    return std::string(out.c_str()) + "\n";
}

} // namespace envelope
} // namespace dycrypt
