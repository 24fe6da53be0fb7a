#pragma once

#include "errors.hpp"
#include "index.hpp"
#include "reader.hpp"
#include "scanner.hpp"
#include "sections.hpp"
#include "tables.hpp"
#include "templates.hpp"
#include "types.hpp"
#include "writer.hpp"
