// src/ess/model_factory.cpp
#include "ess/model_factory.hpp"
#include "ess/empirical_model.hpp"
#include "ess/linear_model.hpp"
#include "ess/lookup_table.hpp"
#include "ess/soh_model.hpp"
#include "ess/table_model.hpp"
#include "utils/logging.hpp"

namespace ess {

std::unique_ptr<BatteryModel> make_battery_model(const BatteryConfig& cfg,
                                                 TransitionHistory* history) {
    cfg.validate();

    SohModel soh;
    if (!cfg.soh_curve_path.empty()) {
        soh = SohModel(SohModel::load_curve(cfg.soh_curve_path));
    }
    soh.set_initial_soh(cfg.soh_0);

    MGSIM_LOG_INFO("[make_battery_model] chemistry=%s E_n=%.2f kWh (Ns=%d Np=%d c_n=%.3f Ah) SOH_0=%.3f",
                   to_string(cfg.chemistry), cfg.nominal_energy_kwh(), cfg.ns, cfg.np, cfg.c_n_ah, cfg.soh_0);

    switch (cfg.chemistry) {
        case Chemistry::Linear: {
            auto model = std::make_unique<LinearModel>(cfg, history);
            model->set_soh_model(std::move(soh));
            return model;
        }
        case Chemistry::Empirical: {
            auto model = std::make_unique<EmpiricalModel>(cfg, history);
            model->set_soh_model(std::move(soh));
            return model;
        }
        case Chemistry::NMC:
        case Chemistry::NCA:
        case Chemistry::LFP: {
            if (cfg.table_path.empty()) {
                throw TableLoadError(std::string("No lookup table configured for chemistry ") +
                                     to_string(cfg.chemistry));
            }
            auto table = VocR0Table::load(cfg.table_path, cfg.ns, cfg.np,
                                          cfg.reference_capacity_ah, cfg.c_n_ah);
            auto model = std::make_unique<TableModel>(cfg, std::move(table), history);
            model->set_soh_model(std::move(soh));
            return model;
        }
    }
    throw std::invalid_argument("Unknown battery chemistry");
}

} // namespace ess
