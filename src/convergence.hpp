//
//  convergence.hpp
//  dmft-scf
//

#ifndef convergence_hpp
#define convergence_hpp

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "coordinator.hpp"

class CheckpointStore;


enum class ConvMode : int {Absolute = 0, Relative = 1, WindowStd = 2};

ConvMode convModeFromString(const std::string& s);

// Observable names: d_mu, d_orb_occ, d_imp_occ, d_Gimp, d_G0, d_Sigma
struct ConvCriterion {
    std::string observable;
    double threshold;
};

struct ConvOptions {
    std::vector<ConvCriterion> criteria;
    std::size_t window = 3;
    ConvMode mode = ConvMode::Absolute;
};


// Per site history of observable changes. The last `window` entries are used for the checks; the whole history is kept
// for the archive.
class ConvergenceMonitor {
public:
    ConvergenceMonitor(const ConvOptions& opts, const Eigen::Index nsites);

    static const std::vector<std::string>& observableNames();

    const ConvOptions& options() const {return m_opts;}
    Eigen::Index nSites() const {return m_nsites;}

    // delta is the change of the observable in this iteration, magnitude its current size (used by the relative mode)
    void record(const Eigen::Index isite, const std::string& observable, const double delta, const double magnitude);

    // nullopt if there is no criterion or not enough history, otherwise whether all criteria hold on all sites
    std::optional<bool> checkConverged() const;

    // Whole history of recorded changes; empty if nothing was recorded
    std::vector<double> history(const Eigen::Index isite, const std::string& observable) const;
    double latest(const Eigen::Index isite, const std::string& observable) const;

    void write(CheckpointStore& store, const std::string& path) const;
    void load(const CheckpointStore& store, const std::string& path);
    void broadcast(const Coordinator& coord);

private:
    struct Series {
        std::vector<double> deltas, magnitudes;
        std::deque<double> window;
    };

    ConvOptions m_opts;
    Eigen::Index m_nsites;
    // Observable -> per site series
    std::map<std::string, std::vector<Series> > m_series;

    void checkObservable(const std::string& observable) const;
    bool holds(const Series& s, const double threshold) const;
};

#endif /* convergence_hpp */
