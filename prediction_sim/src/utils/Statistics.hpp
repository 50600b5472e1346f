#pragma once

#include <vector>
#include <cmath>
#include <numeric>
#include <algorithm>

namespace prediction {

class Statistics {
public:
    static double mean(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
    }
    
    // Population standard deviation
    static double stddev(const std::vector<double>& data) {
        if (data.size() < 2) return 0.0;
        
        double m = mean(data);
        double sqSum = 0.0;
        for (double x : data) {
            sqSum += (x - m) * (x - m);
        }
        
        return std::sqrt(sqSum / data.size());
    }

    static double min(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        return *std::min_element(data.begin(), data.end());
    }

    static double max(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        return *std::max_element(data.begin(), data.end());
    }

    // Fraction of successes; 0 when there were no trials
    static double rate(double successes, double trials) {
        return trials > 0 ? successes / trials : 0.0;
    }
    
    // Z-score of a value against a sample
    static double zscore(double value, const std::vector<double>& data) {
        double std = stddev(data);
        if (std <= 0) return 0.0;
        return (value - mean(data)) / std;
    }
};

} // namespace prediction
