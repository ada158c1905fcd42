// Source enumeration for the CLI: files as-is, directories recursively.
#include "TaskPlanner.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QRegularExpression>

#include <algorithm>

static bool matchesAny(const QStringList& patterns, const QString& name) {
    for (const QString& p : patterns) {
        const QRegularExpression re = QRegularExpression::fromWildcard(
            p, Qt::CaseSensitive,
            QRegularExpression::UnanchoredWildcardConversion);
        if (re.match(name).hasMatch())
            return true;
    }
    return false;
}

static opencopy::FileTask makeTask(const QFileInfo& fi, const QString& dest,
                                   const QString& relative) {
    opencopy::FileTask t;
    t.sourcePath = QDir::toNativeSeparators(fi.absoluteFilePath()).toStdString();
    t.destPath = QDir::toNativeSeparators(QDir::cleanPath(dest)).toStdString();
    t.size = static_cast<std::uint64_t>(fi.size());
    t.relativePath = relative.toStdString();
    return t;
}

bool TaskPlanner::accepts(const QString& fileName) const {
    if (!opt_.include.isEmpty() && !matchesAny(opt_.include, fileName))
        return false;
    return !matchesAny(opt_.exclude, fileName);
}

bool TaskPlanner::plan(const QStringList& sources, const QString& destination,
                       std::vector<opencopy::FileTask>& out,
                       QStringList& skipped, QString& err) const {
    out.clear();
    if (sources.isEmpty() || destination.isEmpty()) {
        err = QStringLiteral("Missing source or destination");
        return false;
    }

    const QFileInfo destInfo(destination);
    const bool destIsDir = destInfo.isDir() || destination.endsWith('/') ||
                           sources.size() > 1;

    for (const QString& src : sources) {
        const QFileInfo si(src);
        if (!si.exists()) {
            err = QStringLiteral("Source not found: %1").arg(src);
            return false;
        }

        if (si.isFile()) {
            if (!accepts(si.fileName())) {
                skipped << src;
                continue;
            }
            const QString target = destIsDir
                                       ? QDir(destination).filePath(si.fileName())
                                       : destination;
            out.push_back(makeTask(si, target, si.fileName()));
            continue;
        }

        if (!si.isDir())
            continue;
        if (!opt_.recurse) {
            skipped << src;
            continue;
        }

        // Directory: mirror its tree under destination/<dirname>.
        const QDir srcDir(si.absoluteFilePath());
        const QString root = destIsDir || destInfo.exists()
                                 ? QDir(destination).filePath(si.fileName())
                                 : destination;
        QDirIterator it(si.absoluteFilePath(),
                        QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                        QDirIterator::Subdirectories);
        std::vector<opencopy::FileTask> dirTasks;
        while (it.hasNext()) {
            it.next();
            const QFileInfo fi = it.fileInfo();
            if (!accepts(fi.fileName())) {
                skipped << fi.absoluteFilePath();
                continue;
            }
            const QString rel = srcDir.relativeFilePath(fi.absoluteFilePath());
            dirTasks.push_back(makeTask(fi, QDir(root).filePath(rel),
                                        si.fileName() + '/' + rel));
        }
        // QDirIterator order is filesystem-defined; keep batches reproducible.
        std::sort(dirTasks.begin(), dirTasks.end(),
                  [](const opencopy::FileTask& a, const opencopy::FileTask& b) {
                      return a.relativePath < b.relativePath;
                  });
        out.insert(out.end(), dirTasks.begin(), dirTasks.end());
    }

    if (out.empty()) {
        err = QStringLiteral("Nothing to copy");
        return false;
    }
    return true;
}
