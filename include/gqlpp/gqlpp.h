#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/gqlpp.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "gqlpp/gqlpp.h"
//  using namespace gqlpp;
//
//    • TypeDefinition, TypeRef, DefaultValue   (input graph)
//    • ObjectType, UnionType, Field, ...        (concrete types)
//    • TypeCache, BuildContext, Converter       (conversion)
//    • Schema::build()                          (assembly)
//    • console::debug(), info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "errors.h"

// Type graphs
#include "types.h"
#include "definitions.h"

// Conversion
#include "cache.h"
#include "scalars.h"
#include "context.h"
#include "converter.h"
#include "schema.h"
