#include "utils.hpp"

#include <iomanip>
#include <sstream>

using namespace std;

string toHexString(span<const uint8_t> bytes) {
    ostringstream oss;
    oss << hex << setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

bool getCurrentFilePosition(ostream& out, uint64_t& offset) {
    ostream::pos_type pos = out.tellp();
    if (pos == ostream::pos_type(-1)) return false;

    // Header offsets are absolute byte positions from the start of the output
    offset = static_cast<uint64_t>(pos);
    return true;
}
