/// @file amstore.hpp
/// @brief Umbrella header for the amstore library.
///
/// Include this single header for access to all public types:
/// Document, DocumentStore, Transaction, Path, ActorId, ObjId, Value,
/// Change, DocumentOptions, the log sink and Exception.

#pragma once

#include <amstore/change.hpp>
#include <amstore/document.hpp>
#include <amstore/error.hpp>
#include <amstore/log.hpp>
#include <amstore/op.hpp>
#include <amstore/options.hpp>
#include <amstore/path.hpp>
#include <amstore/store.hpp>
#include <amstore/transaction.hpp>
#include <amstore/types.hpp>
#include <amstore/value.hpp>
