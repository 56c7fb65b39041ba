//
//  convergence.cpp
//  dmft-scf
//

#include <algorithm>
#include <cmath>
#include "convergence.hpp"
#include "checkpoint_store.hpp"


ConvMode convModeFromString(const std::string& s) {
    if (s == "absolute") return ConvMode::Absolute;
    else if (s == "relative") return ConvMode::Relative;
    else if (s == "window_std") return ConvMode::WindowStd;
    throw ConfigurationError("Unknown convergence mode " + s + "; allowed modes are absolute, relative and window_std");
}


ConvergenceMonitor::ConvergenceMonitor(const ConvOptions& opts, const Eigen::Index nsites) : m_opts(opts), m_nsites(nsites) {
    if (nsites < 1) throw std::invalid_argument("Convergence monitor needs at least one site!");
    if (m_opts.window < 1) throw ConfigurationError("conv_window must be at least 1");
    if (m_opts.mode == ConvMode::WindowStd && m_opts.window < 2) throw ConfigurationError("conv_window must be at least 2 for the window_std mode");
    for (const auto& c : m_opts.criteria) {
        checkObservable(c.observable);
        if (c.threshold <= 0.0) throw ConfigurationError("Convergence threshold of " + c.observable + " must be positive");
    }
    for (const auto& name : observableNames()) m_series[name].resize(nsites);
}

const std::vector<std::string>& ConvergenceMonitor::observableNames() {
    static const std::vector<std::string> names = {"d_mu", "d_orb_occ", "d_imp_occ", "d_Gimp", "d_G0", "d_Sigma"};
    return names;
}

void ConvergenceMonitor::checkObservable(const std::string& observable) const {
    const auto& names = observableNames();
    if (std::find(names.begin(), names.end(), observable) == names.end()) throw ConfigurationError("Unknown convergence observable " + observable);
}

void ConvergenceMonitor::record(const Eigen::Index isite, const std::string& observable, const double delta, const double magnitude) {
    checkObservable(observable);
    if (isite < 0 || isite >= m_nsites) throw std::range_error("Convergence monitor site index is out of range!");
    Series& s = m_series[observable][isite];
    s.deltas.push_back(delta);
    s.magnitudes.push_back(magnitude);
    s.window.push_back(delta);
    if (s.window.size() > m_opts.window) s.window.pop_front();
}

bool ConvergenceMonitor::holds(const Series& s, const double threshold) const {
    switch (m_opts.mode) {
        case ConvMode::Relative: {
            const double mag = std::abs(s.magnitudes.back());
            return (mag > 0.0 ? std::abs(s.deltas.back()) / mag : std::abs(s.deltas.back())) < threshold;
        }
        case ConvMode::WindowStd: {
            double mean = 0.0, var = 0.0;
            for (const auto d : s.window) mean += d;
            mean /= s.window.size();
            for (const auto d : s.window) var += (d - mean) * (d - mean);
            return std::sqrt(var / s.window.size()) < threshold;
        }
        default:
            return std::abs(s.deltas.back()) < threshold;
    }
}

std::optional<bool> ConvergenceMonitor::checkConverged() const {
    if (m_opts.criteria.empty()) return std::nullopt;
    const std::size_t needed = m_opts.mode == ConvMode::WindowStd ? m_opts.window : 1;
    bool converged = true;
    for (const auto& c : m_opts.criteria) {
        for (const auto& s : m_series.at(c.observable)) {
            if (s.window.size() < needed) return std::nullopt;
            converged = converged && holds(s, c.threshold);
        }
    }
    return converged;
}

std::vector<double> ConvergenceMonitor::history(const Eigen::Index isite, const std::string& observable) const {
    checkObservable(observable);
    return m_series.at(observable).at(isite).deltas;
}

double ConvergenceMonitor::latest(const Eigen::Index isite, const std::string& observable) const {
    checkObservable(observable);
    const auto& d = m_series.at(observable).at(isite).deltas;
    if (d.empty()) throw std::out_of_range("No value of " + observable + " recorded yet!");
    return d.back();
}

void ConvergenceMonitor::write(CheckpointStore& store, const std::string& path) const {
    if (!store.exists(path)) store.createGroup(path);
    for (const auto& [name, series] : m_series) {
        for (Eigen::Index s = 0; s < m_nsites; ++s) {
            if (series[s].deltas.empty()) continue;
            store.writeVector(path + "/" + name + "_" + std::to_string(s), series[s].deltas);
            store.writeVector(path + "/" + name + "_" + std::to_string(s) + "_magnitude", series[s].magnitudes);
        }
    }
}

void ConvergenceMonitor::load(const CheckpointStore& store, const std::string& path) {
    for (auto& [name, series] : m_series) {
        for (Eigen::Index s = 0; s < m_nsites; ++s) {
            Series& sr = series[s];
            sr = Series();
            const std::string key = path + "/" + name + "_" + std::to_string(s);
            if (!store.exists(key)) continue;
            const std::vector<double> deltas = store.readVector(key);
            const std::vector<double> mags = store.readVector(key + "_magnitude");
            if (deltas.size() != mags.size()) throw InconsistentStateError("Convergence history " + key + " is corrupted");
            for (std::size_t i = 0; i < deltas.size(); ++i) record(s, name, deltas[i], mags[i]);
        }
    }
}

void ConvergenceMonitor::broadcast(const Coordinator& coord) {
    for (auto& [name, series] : m_series) {
        for (auto& sr : series) {
            coord.broadcast(sr.deltas);
            coord.broadcast(sr.magnitudes);
            sr.window.assign(sr.deltas.end() - std::min(sr.deltas.size(), m_opts.window), sr.deltas.end());
        }
    }
}
