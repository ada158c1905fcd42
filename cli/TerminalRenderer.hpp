// Line-oriented progress output and logging bridge for the CLI.
#pragma once
#include <QTextStream>
#include <map>
#include "opencopy/CopyOrchestrator.hpp"
#include "opencopy/ProgressReporter.hpp"

class TerminalRenderer : public opencopy::ProgressRenderer,
                         public opencopy::CopyEvents {
public:
    // interactive=false prints only terminal states (no carriage returns).
    explicit TerminalRenderer(bool interactive, bool quiet = false);

    void render(const opencopy::ProgressSnapshot& snapshot) override;

    void issue(const opencopy::CopyIssue& issue) override;
    void debug(const std::string& message) override;
    void finished(const opencopy::CopyReport& report) override;

private:
    QTextStream err_;
    bool interactive_;
    bool quiet_;
    bool lineOpen_ = false;
    std::map<int, opencopy::ProgressSnapshot> bars_;

    void drawLine();
    void closeLine();
};
