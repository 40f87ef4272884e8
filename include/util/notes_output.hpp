#pragma once

#include <cstdio>
#include <string>

namespace sysupdate {

// Sink for the operator-facing progress lines of an update run.
class INotesOutput {
  public:
    virtual ~INotesOutput() = default;
    virtual void WriteLine(const std::string& line) = 0;
};

class ConsoleNotes final : public INotesOutput {
  public:
    explicit ConsoleNotes(std::FILE* out = stdout) : out_(out) {}

    void WriteLine(const std::string& line) override;

  private:
    std::FILE* out_;
};

} // namespace sysupdate
