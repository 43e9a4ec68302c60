#pragma once

#include <jsondb/core/Object.h>
#include <jsondb/core/Document.h>
#include <jsondb/core/Registry.h>
#include <jsondb/filesystem/AtomicFile.h>
#include <jsondb/parser/json.h>
#include <jsondb/support/logging.h>
