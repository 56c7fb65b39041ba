//
//  mixer.cpp
//  dmft-scf
//

#include <vector>
#include <Eigen/LU>
#include "mixer.hpp"
#include "checkpoint_store.hpp"


MixType mixTypeFromString(const std::string& s) {
    if (s == "linear") return MixType::Linear;
    else if (s == "broyden") return MixType::Broyden;
    throw ConfigurationError("Unknown mixing type " + s + "; allowed types are linear and broyden");
}


Mixer::Mixer(const double alpha) : m_alpha(alpha) {
    if (alpha <= 0.0 || alpha > 1.0) throw ConfigurationError("Mixing parameter must be in (0, 1]");
}

BlockGf Mixer::mix(const BlockGf& input, const BlockGf& output) {
    input.checkSameStructure(output);
    BlockGf next(output);
    next.fromRealVector(mix(input.toRealVector(), output.toRealVector()));
    return next;
}


Eigen::VectorXd LinearMixer::mix(const Eigen::VectorXd& input, const Eigen::VectorXd& output) {
    if (input.size() != output.size()) throw std::invalid_argument("LinearMixer: input and output sizes differ!");
    return m_alpha * output + (1.0 - m_alpha) * input;
}


BroydenMixer::BroydenMixer(const double alpha, const std::size_t maxHistory, const double w0) : Mixer(alpha), m_maxHistory(maxHistory), m_w0(w0) {
    if (maxHistory < 1) throw ConfigurationError("broy_max_it must be at least 1");
}

void BroydenMixer::reset() {
    m_lastInput.resize(0);
    m_lastResidual.resize(0);
    m_dV.clear();
    m_dF.clear();
}

Eigen::VectorXd BroydenMixer::mix(const Eigen::VectorXd& input, const Eigen::VectorXd& output) {
    if (input.size() != output.size()) throw std::invalid_argument("BroydenMixer: input and output sizes differ!");
    const Eigen::VectorXd F = output - input;

    if (m_lastInput.size() == input.size()) {
        Eigen::VectorXd dF = F - m_lastResidual;
        const double nrm = dF.norm();
        if (nrm > 0.0) {
            m_dF.push_back(dF / nrm);
            m_dV.push_back((input - m_lastInput) / nrm);
            if (m_dF.size() > m_maxHistory) {
                m_dF.pop_front();
                m_dV.pop_front();
            }
        }
    }
    else if (m_lastInput.size() > 0) reset();   // Vector length changed; history is meaningless
    m_lastInput = input;
    m_lastResidual = F;

    Eigen::VectorXd next = input + m_alpha * F;
    const Eigen::Index m = static_cast<Eigen::Index>(m_dF.size());
    if (m == 0) return next;

    Eigen::MatrixXd a(m, m);
    Eigen::VectorXd c(m);
    for (Eigen::Index i = 0; i < m; ++i) {
        c(i) = m_dF[i].dot(F);
        for (Eigen::Index j = 0; j <= i; ++j) {
            a(i, j) = m_dF[i].dot(m_dF[j]);
            a(j, i) = a(i, j);
        }
        a(i, i) += m_w0 * m_w0;
    }
    const Eigen::VectorXd gamma = a.partialPivLu().solve(c);
    for (Eigen::Index l = 0; l < m; ++l) next -= gamma(l) * (m_alpha * m_dF[l] + m_dV[l]);
    return next;
}

void BroydenMixer::saveHistory(CheckpointStore& store, const std::string& path) const {
    if (store.exists(path)) store.remove(path);
    store.createGroup(path);
    store.writeInt(path + "/n_hist", static_cast<long>(m_dF.size()));
    auto tovec = [](const Eigen::VectorXd& v) {return std::vector<double>(v.data(), v.data() + v.size());};
    store.writeVector(path + "/last_input", tovec(m_lastInput));
    store.writeVector(path + "/last_residual", tovec(m_lastResidual));
    for (std::size_t k = 0; k < m_dF.size(); ++k) {
        store.writeVector(path + "/dV_" + std::to_string(k), tovec(m_dV[k]));
        store.writeVector(path + "/dF_" + std::to_string(k), tovec(m_dF[k]));
    }
}

void BroydenMixer::loadHistory(const CheckpointStore& store, const std::string& path) {
    reset();
    if (!store.exists(path)) return;
    auto fromvec = [](const std::vector<double>& v) {return Eigen::VectorXd(Eigen::Map<const Eigen::VectorXd>(v.data(), v.size()));};
    const long nhist = store.readInt(path + "/n_hist");
    m_lastInput = fromvec(store.readVector(path + "/last_input"));
    m_lastResidual = fromvec(store.readVector(path + "/last_residual"));
    if (m_lastInput.size() != m_lastResidual.size()) throw InconsistentStateError("Broyden history at " + path + " is corrupted");
    for (long k = std::max(0L, nhist - static_cast<long>(m_maxHistory)); k < nhist; ++k) {
        m_dV.push_back(fromvec(store.readVector(path + "/dV_" + std::to_string(k))));
        m_dF.push_back(fromvec(store.readVector(path + "/dF_" + std::to_string(k))));
        if (m_dV.back().size() != m_lastInput.size() || m_dF.back().size() != m_lastInput.size())
            throw InconsistentStateError("Broyden history at " + path + " is corrupted");
    }
}

void BroydenMixer::broadcastHistory(const Coordinator& coord) {
    int n = static_cast<int>(m_dF.size());
    coord.broadcast(n);
    coord.broadcast(m_lastInput);
    coord.broadcast(m_lastResidual);
    m_dV.resize(n);
    m_dF.resize(n);
    for (int k = 0; k < n; ++k) {
        coord.broadcast(m_dV[k]);
        coord.broadcast(m_dF[k]);
    }
}


std::unique_ptr<Mixer> makeMixer(const MixType type, const double alpha, const std::size_t maxHistory) {
    if (type == MixType::Broyden) return std::make_unique<BroydenMixer>(alpha, maxHistory);
    return std::make_unique<LinearMixer>(alpha);
}
