/**
 * Name: Lexer headers umbrella
 * Purpose: Provide a stable include that aggregates single-declaration headers.
 */
#pragma once

#include "lexer/TokenKind.h"
#include "lexer/Token.h"
#include "lexer/ITokenStream.h"
#include "lexer/SourceBuffer.h"
#include "lexer/LexState.h"
#include "lexer/LexerOptions.h"
#include "lexer/LexerDecl.h"
