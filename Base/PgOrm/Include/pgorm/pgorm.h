#ifndef pgorm_PGORM_H
#define pgorm_PGORM_H

#include "pgorm/changeset.h"
#include "pgorm/condition.h"
#include "pgorm/db_manager.h"
#include "pgorm/error.h"
#include "pgorm/executor.h"
#include "pgorm/model_definition.h"
#include "pgorm/model_meta.h"
#include "pgorm/preloader.h"
#include "pgorm/query.h"
#include "pgorm/repo.h"
#include "pgorm/row.h"
#include "pgorm/schema_registry.h"
#include "pgorm/sql_compiler.h"

#endif  // pgorm_PGORM_H
