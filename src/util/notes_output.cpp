#include "util/notes_output.hpp"

namespace sysupdate {

void ConsoleNotes::WriteLine(const std::string& line) {
    std::fprintf(out_, "%s\n", line.c_str());
    std::fflush(out_);
}

} // namespace sysupdate
