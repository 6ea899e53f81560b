/***
 * Name: rbparse::ast nodes
 * Purpose: Umbrella include for every concrete AST node.
 */
#pragma once

#include "ast/Node.h"
#include "ast/Structure.h"
#include "ast/Literals.h"
#include "ast/Variables.h"
#include "ast/Assignments.h"
#include "ast/Calls.h"
#include "ast/Parameters.h"
#include "ast/Definitions.h"
#include "ast/ControlFlow.h"
#include "ast/CaseNode.h"
#include "ast/Patterns.h"
