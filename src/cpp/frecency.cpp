#include "frecency.hpp"
#include "debug.hpp"
#include <algorithm>
#include <utility>

std::map<std::string, double> decay(const std::map<std::string, double>& frequency,
                                    double discount_factor) {
    std::map<std::string, double> decayed;
    for (const auto& entry : frequency) {
        decayed.emplace_hint(decayed.end(), entry.first, entry.second * discount_factor);
    }
    return decayed;
}

void record_visit(Database& db, const std::string& directory, double now,
                  const FrecencyPolicy& policy) {
    db.frequency = decay(db.frequency, policy.discount_factor);
    db.frequency[directory] += 1.0;
    db.last_visit[directory] = now;

    DEBUG_LOGLN << "Increased count for '" << directory << "' to " << db.frequency[directory];
}

size_t evict_stale(Database& db, double now, double max_age) {
    std::vector<std::string> stale;
    for (const auto& entry : db.last_visit) {
        if (now - entry.second > max_age) {
            stale.push_back(entry.first);
        }
    }

    for (const auto& directory : stale) {
        DEBUG_LOGLN << "Forgetting stale directory " << directory;
        db.last_visit.erase(directory);
        db.frequency.erase(directory);
    }

    return stale.size();
}

void visit(Database& db, const std::string& directory, double now,
           const FrecencyPolicy& policy) {
    record_visit(db, directory, now, policy);
    evict_stale(db, now, policy.max_age_seconds);
}

// Sort keys of a score map by descending value, keeping map (path) order on ties
static std::vector<std::string> ranked(const std::map<std::string, double>& scores) {
    std::vector<std::pair<std::string, double>> entries(scores.begin(), scores.end());
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> directories;
    directories.reserve(entries.size());
    for (auto& entry : entries) {
        directories.push_back(std::move(entry.first));
    }
    return directories;
}

std::vector<std::string> ranked_by_frequency(const Database& db) {
    return ranked(db.frequency);
}

std::vector<std::string> ranked_by_recency(const Database& db) {
    return ranked(db.last_visit);
}
