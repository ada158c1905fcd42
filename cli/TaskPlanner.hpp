// Resolves command-line sources into an ordered list of copy tasks.
#pragma once
#include <QString>
#include <QStringList>
#include <vector>
#include "opencopy/CopyTypes.hpp"

struct PlanOptions {
    bool recurse = false;
    QStringList include;  // wildcard patterns on the file name; empty = all
    QStringList exclude;
};

class TaskPlanner {
public:
    explicit TaskPlanner(const PlanOptions& opt) : opt_(opt) {}

    // Builds tasks for `sources` copied into `destination`. A single file
    // source may be copied onto a file path; otherwise destination is a
    // directory. Returns false (with err) on unusable input. Entries that are
    // skipped (directories without recursion, filtered names) are listed in
    // `skipped`.
    bool plan(const QStringList& sources, const QString& destination,
              std::vector<opencopy::FileTask>& out, QStringList& skipped,
              QString& err) const;

private:
    PlanOptions opt_;

    bool accepts(const QString& fileName) const;
};
