#include "codecError.hpp"

using namespace std;

string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io:
            return "IO";
        case ErrorKind::Decode:
            return "DECODE";
        default:
            return "UNKNOWN";
    }
}

ostream& operator<<(ostream& os, const CodecError& error) {
    return os << errorKindToString(error.kind) << " error: " << error.message;
}
