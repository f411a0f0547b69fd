// Public header for the jerry library
#pragma once

#include <jr/error.h>
#include <jr/reader.h>
#include <jr/token.h>
#include <jr/tokenizer.h>
#include <jr/value.h>
#include <jr/parser.h>
