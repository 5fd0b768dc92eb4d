#pragma once
#include <stdexcept>
#include <string>

// Every failure the retrieval core reports to its host derives from this, so a
// transport layer can map each type to its own status without string matching.
struct RetrievalError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Encoding failed: model unreachable, bad response, invalid text encoding.
struct EmbeddingError : RetrievalError {
    using RetrievalError::RetrievalError;
};

// A query was issued before any bundle was loaded or built.
struct NotLoadedError : RetrievalError {
    NotLoadedError() : RetrievalError("vector index not loaded") {}
    using RetrievalError::RetrievalError;
};

struct ConfigError : RetrievalError {
    using RetrievalError::RetrievalError;
};

// Persisted or in-memory state violates the vector/record alignment.
struct CorruptionError : RetrievalError {
    using RetrievalError::RetrievalError;
};

struct EmptyQueryError : RetrievalError {
    EmptyQueryError() : RetrievalError("query text is empty") {}
    using RetrievalError::RetrievalError;
};

// Source corpus could not be turned into records.
struct IngestError : RetrievalError {
    using RetrievalError::RetrievalError;
};
