#include "batch.hpp"

#include <iostream>
#include <optional>
#include <sstream>

bool runBatch(const std::vector<const MaterialDef*>& materials, uint32_t runSeed,
              const GenOptions& opt, TextureSink& sink, bool verbose,
              BatchReport& report, std::string* err) {
    bool haveGroup = false;
    MaterialGroup group = MaterialGroup::Overworld;

    for (const MaterialDef* def : materials) {
        if (!def) {
            if (err) *err = "null material in batch";
            return false;
        }

        if (verbose && (!haveGroup || def->group != group)) {
            std::cout << "\n" << groupLabel(def->group) << ":\n";
            group = def->group;
            haveGroup = true;
        }

        RNG rng(hashCombine(runSeed, fnv1a32(def->name)));

        TextureSet set;
        std::string genErr;
        if (!generateMaterial(*def, rng, opt, set, &genErr)) {
            if (err) *err = genErr;
            return false;
        }

        std::ostringstream line;
        for (size_t i = 0; i < set.frames.size(); ++i) {
            const std::optional<int> frame =
                def->frameCount > 1 ? std::optional<int>(static_cast<int>(i)) : std::nullopt;

            if (!sink.store(set.name, frame, set.frames[i])) {
                if (err) *err = sink.lastError();
                return false;
            }
            ++report.stored;

            if (i > 0) line << ", ";
            line << slotName(set.name, frame);
        }
        ++report.materials;

        if (verbose) std::cout << "  " << line.str() << "\n";
    }
    return true;
}
