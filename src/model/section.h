#ifndef REPORTFLOW_SECTION_H
#define REPORTFLOW_SECTION_H

#include <QList>
#include <QString>

#include "contentblock.h"

namespace Report {

struct Section {
    QString title;              // empty = no title line
    QList<ContentBlock> blocks;
    bool pageBreakBefore = false; // start on a fresh page (never a blank one)
};

} // namespace Report

#endif // REPORTFLOW_SECTION_H
