#pragma once

#include <sg/capabilities.h>
#include <sg/config.h>
#include <sg/dictionary.h>
#include <sg/errors.h>
#include <sg/field_path.h>
#include <sg/format_checkers.h>
#include <sg/http_client.h>
#include <sg/json.h>
#include <sg/log.h>
#include <sg/name_heuristic.h>
#include <sg/pipeline.h>
#include <sg/report.h>
#include <sg/schema.h>
#include <sg/schema_source.h>
#include <sg/semantic.h>
#include <sg/structural_validator.h>
