// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Logging.h"

Q_LOGGING_CATEGORY(lcIndex, "findex.index", QtInfoMsg)
Q_LOGGING_CATEGORY(lcQuery, "findex.query", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSearch, "findex.search", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScan, "findex.scan", QtInfoMsg)
Q_LOGGING_CATEGORY(lcService, "findex.service", QtInfoMsg)
