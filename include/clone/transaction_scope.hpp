#pragma once

#include "clone/vm_transaction.hpp"
#include "common/logger.hpp"
#include <exception>
#include <string>

// Drives the transaction to BEGUN, runs body(transaction) and commits on
// every exit from body. A commit failure after a throwing body is logged and
// the body's exception is rethrown; after a successful body it propagates.
template <typename Body>
void runInTransaction(VMTransaction& transaction, Body&& body) {
    transaction.initialize();
    transaction.prepare();
    transaction.begin();

    try {
        body(transaction);
    } catch (...) {
        Logger::info("Exception occurred before committing");
        try {
            transaction.commit();
        } catch (const std::exception& e) {
            Logger::error(std::string("Failed in committing: ") + e.what());
        } catch (...) {
            Logger::error("Failed in committing: unknown error");
        }
        throw;
    }

    try {
        transaction.commit();
    } catch (const std::exception& e) {
        Logger::error(std::string("Failed in committing: ") + e.what());
        throw;
    }
}
