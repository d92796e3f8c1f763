#pragma once

#include <map>
#include <string>
#include <vector>
#include "database.hpp"

// Scoring parameters (overridable from config.yaml)
struct FrecencyPolicy {
    static constexpr double DEFAULT_DISCOUNT_FACTOR = 0.99;
    static constexpr double DEFAULT_MAX_AGE_SECONDS = 30.0 * 24 * 3600;

    double discount_factor = DEFAULT_DISCOUNT_FACTOR;
    double max_age_seconds = DEFAULT_MAX_AGE_SECONDS;
};

// Multiply every score by the discount factor
std::map<std::string, double> decay(const std::map<std::string, double>& frequency,
                                    double discount_factor);

// Decay all scores, then count one visit to directory at time now.
// Callers only invoke this after a successful change into a non-ignored directory.
void record_visit(Database& db, const std::string& directory, double now,
                  const FrecencyPolicy& policy = FrecencyPolicy());

// Forget directories last visited more than max_age seconds before now.
// Returns the number of directories removed.
size_t evict_stale(Database& db, double now, double max_age);

// Record a visit and prune stale entries in one step
void visit(Database& db, const std::string& directory, double now,
           const FrecencyPolicy& policy = FrecencyPolicy());

// Directories ordered by descending score; ties keep path order
std::vector<std::string> ranked_by_frequency(const Database& db);
std::vector<std::string> ranked_by_recency(const Database& db);
