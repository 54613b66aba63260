/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <linkbudget/report.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <array>
#include <cmath>

namespace linkbudget {

using spdlog::info;

std::string formatRate(double bitsPerSecond) {
    constexpr std::array<const char*, 5> units = {"bps", "kbps", "Mbps", "Gbps", "Tbps"};

    double value = bitsPerSecond;
    size_t unit = 0;
    while (std::fabs(value) >= 1e3 && unit < units.size() - 1) {
        value /= 1e3;
        unit++;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}

std::string formatStage(const StageReport& stage) {
    auto label = fmt::format("{}:", stage.label);
    if (stage.unit == "bps") {
        return fmt::format("{:<19} {}", label, formatRate(stage.value));
    }
    return fmt::format("{:<19} {:6.2f} {}", label, stage.value, stage.unit);
}

void logStage(const StageReport& stage) {
    info("{}", formatStage(stage));
}

// Singular geometries yield NaN angles, which are written as NaN literals
using JSONWriter = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                     rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

std::string toJSON(const LinkBudgetResult& result) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);

    writer.StartObject();

    writer.Key("pointing");
    writer.StartObject();
    writer.Key("elevation");
    writer.Double(result.pointing.elevationInDegrees);
    writer.Key("azimuth");
    writer.Double(result.pointing.azimuthInDegrees);
    writer.Key("slant_range");
    writer.Double(result.pointing.slantRangeInMeters);
    writer.EndObject();

    writer.Key("eirp_db");
    writer.Double(result.eirpInDbw);
    writer.Key("path_loss_db");
    writer.Double(result.pathLossInDb);
    writer.Key("rx_dish_gain_db");
    writer.Double(result.rxDishGainInDb);

    writer.Key("noise_fig_db");
    writer.StartObject();
    writer.Key("lnb");
    writer.Double(result.noiseFigureInDb.lnb);
    writer.Key("coax");
    writer.Double(result.noiseFigureInDb.coax);
    writer.Key("total");
    writer.Double(result.noiseFigureInDb.total);
    writer.EndObject();

    writer.Key("noise_temp_k");
    writer.StartObject();
    writer.Key("effective_input");
    writer.Double(result.noiseTempInKelvin.effectiveInput);
    writer.Key("system");
    writer.Double(result.noiseTempInKelvin.system);
    writer.EndObject();

    writer.Key("cnr_db");
    writer.Double(result.cnrInDb);
    writer.Key("capacity_bps");
    writer.Double(result.capacityInBps);

    writer.EndObject();

    return buffer.GetString();
}

}
