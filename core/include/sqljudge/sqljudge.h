#pragma once

#include "sqljudge/comparator.h"
#include "sqljudge/config.h"
#include "sqljudge/dataset_registry.h"
#include "sqljudge/diagnostics.h"
#include "sqljudge/errors.h"
#include "sqljudge/executor.h"
#include "sqljudge/judge.h"
#include "sqljudge/normalizer.h"
#include "sqljudge/result_table.h"
#include "sqljudge/statement_filter.h"
#include "sqljudge/verdict.h"
#include "sqljudge/version.h"
