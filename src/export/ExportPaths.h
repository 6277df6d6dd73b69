#pragma once

#include <QString>
#include <QStringList>

namespace ExportPaths {

// Joins dir and filename, appending ".mp4" unless already present
QString buildOutputPath(const QString& outputDir, const QString& filename);

// Every problem with the path; empty when it can be written
QStringList validateOutputPath(const QString& outputPath);

// Removes manifests and trim artifacts left behind by attempts that never
// reached cleanup (crash, kill). Only files last modified more than minAgeMs
// ago are touched, so a concurrent export sharing the directory keeps its
// files. Best-effort; returns how many were removed.
int cleanupStaleScratchFiles(const QString& scratchDir, qint64 minAgeMs);

// Age a live export's scratch files can reach: a day, or longer than one tool run
qint64 staleScratchAge(int toolTimeoutMs);

} // namespace ExportPaths
