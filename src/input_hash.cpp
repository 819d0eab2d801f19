#include "input_hash.hpp"
#include "io/json_codec.hpp"
#include <iomanip>
#include <sstream>

namespace retireplan {

void Fnv1a64::update(const std::string& bytes) {
    for (unsigned char c : bytes) {
        hash_ ^= static_cast<uint64_t>(c);
        hash_ *= PRIME;
    }
}

std::string hash_projection_input(const ProjectionInput& input) {
    // nlohmann::json objects keep keys sorted, so dump() is canonical
    Fnv1a64 hasher;
    hasher.update(io::canonical_projection_input_json(input).dump());

    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << hasher.value();
    return oss.str();
}

} // namespace retireplan
