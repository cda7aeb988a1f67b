#include "mdhealth/updater.hh"

#include "mdhealth/record.hh"


void mdhealth::record_updater::update(stats_tree& tree, const record& rec) {
	++tree.record_count;
	auto& specs=_schema.fields();
	for(std::size_t i=0; i<specs.size() && i<rec.num_fields(); ++i) {
		auto v=rec.field(i);
		if(!v)
			continue;
		auto& spec=specs[i];
		auto it=tree.fields.find(spec.name);
		if(it==tree.fields.end()) {
			field_stats fs{};
			fs.status=spec.status;
			it=tree.fields.emplace(spec.name, std::move(fs)).first;
		}
		auto& fs=it->second;
		++fs.count;
		fs.instances+=v->is_array()?v->size():1;
		if(spec.has_subfields())
			update_subfields(fs, spec, *v);
	}
	refresh_derived(tree);
}

void mdhealth::record_updater::update(entity_stats& stats, const record& rec) {
	update(stats.summary, rec);
	auto rtype=rec.resource_type();
	if(rtype.empty() || !_schema.is_resource_type(rtype))
		return;
	auto it=stats.by_resource_type.find(rtype);
	if(it==stats.by_resource_type.end())
		it=stats.by_resource_type.emplace(std::string{rtype}, create_empty_tree(_schema)).first;
	update(it->second, rec);
}

void mdhealth::record_updater::update_subfields(field_stats& fs, const field_spec& spec, const nlohmann::json& value) {
	bool multi=spec.repeatable && value.is_array();
	for(auto& sub: spec.subfields) {
		auto it=fs.subfields.find(sub.name);
		if(it==fs.subfields.end()) {
			subfield_stats ss{};
			if(sub.enumerated())
				ss.values.emplace();
			it=fs.subfields.emplace(sub.name, std::move(ss)).first;
		}
		auto& ss=it->second;

		bool seen{false};
		auto visit=[this,&sub,&ss,&seen](const nlohmann::json& occ) {
			if(!occ.is_object())
				return;
			_obs.clear();
			sub.extract(sub, occ, _obs);
			if(_obs.empty())
				return;
			if(!seen) {
				++ss.count;
				seen=true;
			}
			ss.instances+=_obs.size();
			if(!sub.enumerated())
				return;
			if(!ss.values)
				ss.values.emplace();
			for(auto o: _obs) {
				if(auto val=sub.classify(o); val)
					++(*ss.values)[*val];
			}
		};
		if(multi) {
			for(auto& occ: value)
				visit(occ);
		} else {
			visit(value);
		}
	}
}
