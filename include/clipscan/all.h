#ifndef CLIPSCAN_H
#define CLIPSCAN_H

#include "cli/cli.hpp"
#include "correlate/correlate.hpp"
#include "io/io.hpp"
#include "log/log.hpp"
#include "match/match.hpp"
#include "report/report.hpp"
#include "scan/scan.hpp"
#include "source/source.hpp"
#include "store/store.hpp"
#include "util/util.hpp"

#endif //CLIPSCAN_H
