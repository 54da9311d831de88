#pragma once

#include "gomca/config.hpp"
#include "gomca/errors.hpp"
#include "gomca/format.hpp"
#include "gomca/objdump.hpp"
#include "gomca/pipeline.hpp"
#include "gomca/tabwriter.hpp"
#include "gomca/transform.hpp"
#include "gomca/utils.hpp"
