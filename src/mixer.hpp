//
//  mixer.hpp
//  dmft-scf
//

#ifndef mixer_hpp
#define mixer_hpp

#include <deque>
#include <memory>
#include <string>
#include "coordinator.hpp"
#include "gf_data_wrapper.hpp"

class CheckpointStore;


enum class MixType : int {Linear = 0, Broyden = 1};

MixType mixTypeFromString(const std::string& s);


// Damping of the fixed-point iteration x -> g(x) of one site's quantity. mix() receives the input of the last step
// and the step's output, and returns the next input.
class Mixer {
public:
    explicit Mixer(const double alpha);
    virtual ~Mixer() {}

    double alpha() const {return m_alpha;}
    virtual std::string name() const = 0;

    virtual Eigen::VectorXd mix(const Eigen::VectorXd& input, const Eigen::VectorXd& output) = 0;
    BlockGf mix(const BlockGf& input, const BlockGf& output);

    virtual void reset() {}
    virtual void saveHistory(CheckpointStore&, const std::string&) const {}
    virtual void loadHistory(const CheckpointStore&, const std::string&) {}
    virtual void broadcastHistory(const Coordinator&) {}

protected:
    double m_alpha;
};


// new = alpha * output + (1 - alpha) * input
class LinearMixer : public Mixer {
public:
    explicit LinearMixer(const double alpha) : Mixer(alpha) {}

    std::string name() const override {return "linear";}
    Eigen::VectorXd mix(const Eigen::VectorXd& input, const Eigen::VectorXd& output) override;
    using Mixer::mix;
};


// Modified Broyden mixing (D. D. Johnson, PRB 38, 12807) on the residual F = output - input, with a bounded history
// of normalized differences. The first call returns the simple mixing input + alpha * F.
class BroydenMixer : public Mixer {
public:
    BroydenMixer(const double alpha, const std::size_t maxHistory, const double w0 = 0.01);

    std::string name() const override {return "broyden";}
    Eigen::VectorXd mix(const Eigen::VectorXd& input, const Eigen::VectorXd& output) override;
    using Mixer::mix;

    std::size_t historySize() const {return m_dV.size();}
    std::size_t maxHistory() const {return m_maxHistory;}

    void reset() override;
    void saveHistory(CheckpointStore& store, const std::string& path) const override;
    void loadHistory(const CheckpointStore& store, const std::string& path) override;
    void broadcastHistory(const Coordinator& coord) override;

private:
    std::size_t m_maxHistory;
    double m_w0;
    Eigen::VectorXd m_lastInput, m_lastResidual;
    std::deque<Eigen::VectorXd> m_dV, m_dF;
};


std::unique_ptr<Mixer> makeMixer(const MixType type, const double alpha, const std::size_t maxHistory);

#endif /* mixer_hpp */
