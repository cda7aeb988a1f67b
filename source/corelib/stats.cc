#include "mdhealth/stats.hh"

#include <cmath>


bool mdhealth::operator==(const subfield_stats& a, const subfield_stats& b) noexcept {
	return a.count==b.count && a.instances==b.instances
		&& a.missing==b.missing && a.completeness==b.completeness
		&& a.values==b.values;
}
bool mdhealth::operator==(const field_stats& a, const field_stats& b) noexcept {
	return a.count==b.count && a.instances==b.instances
		&& a.missing==b.missing && a.completeness==b.completeness
		&& a.status==b.status && a.subfields==b.subfields;
}
bool mdhealth::operator==(const category_metrics& a, const category_metrics& b) noexcept {
	return a.mandatory==b.mandatory && a.recommended==b.recommended
		&& a.optional==b.optional;
}
bool mdhealth::operator==(const stats_tree& a, const stats_tree& b) noexcept {
	return a.record_count==b.record_count && a.fields==b.fields
		&& a.categories==b.categories;
}
bool mdhealth::operator==(const entity_stats& a, const entity_stats& b) noexcept {
	return a.summary==b.summary && a.by_resource_type==b.by_resource_type;
}

mdhealth::stats_tree mdhealth::create_empty_tree(const schema& sch) {
	stats_tree tree{};
	for(auto& spec: sch.fields()) {
		field_stats fs{};
		fs.status=spec.status;
		for(auto& sub: spec.subfields) {
			subfield_stats ss{};
			if(sub.enumerated()) {
				ss.values.emplace();
				for(auto& v: sub.values)
					ss.values->emplace(v, 0);
			}
			fs.subfields.emplace(sub.name, std::move(ss));
		}
		tree.fields.emplace(spec.name, std::move(fs));
	}
	return tree;
}

mdhealth::entity_stats mdhealth::create_empty_entity_stats(const schema& sch) {
	entity_stats stats{};
	stats.summary=create_empty_tree(sch);
	for(auto& t: sch.resource_types())
		stats.by_resource_type.emplace(t, stats.summary);
	return stats;
}

void mdhealth::refresh_derived(stats_tree& tree) {
	auto total=tree.record_count;
	uint64_t sums[num_field_status]={0, 0, 0};
	uint64_t nums[num_field_status]={0, 0, 0};
	for(auto& [name, fs]: tree.fields) {
		fs.missing=total-fs.count;
		fs.completeness=ratio(fs.count, total);
		for(auto& [subname, ss]: fs.subfields) {
			ss.missing=total-ss.count;
			ss.completeness=ratio(ss.count, total);
		}
		auto i=static_cast<std::size_t>(fs.status);
		sums[i]+=fs.count;
		nums[i]+=1;
	}
	for(std::size_t i=0; i<num_field_status; ++i)
		tree.categories[static_cast<field_status>(i)]=ratio(sums[i], total*nums[i]);
}

namespace {

	inline double round_to(double v, double scale) noexcept {
		return std::round(v*scale)/scale;
	}

	void finalize_tree(mdhealth::stats_tree& tree, double scale) {
		for(auto& [name, fs]: tree.fields) {
			fs.completeness=round_to(fs.completeness, scale);
			for(auto& [subname, ss]: fs.subfields) {
				ss.completeness=round_to(ss.completeness, scale);
				if(!ss.values)
					continue;
				for(auto it=ss.values->begin(); it!=ss.values->end();) {
					if(it->second==0)
						it=ss.values->erase(it);
					else
						++it;
				}
			}
		}
		auto& cat=tree.categories;
		cat.mandatory=round_to(cat.mandatory, scale);
		cat.recommended=round_to(cat.recommended, scale);
		cat.optional=round_to(cat.optional, scale);
	}

}

void mdhealth::finalize(entity_stats& stats, int digits) {
	auto scale=std::pow(10.0, digits);
	finalize_tree(stats.summary, scale);
	for(auto it=stats.by_resource_type.begin(); it!=stats.by_resource_type.end();) {
		if(it->second.record_count==0) {
			it=stats.by_resource_type.erase(it);
			continue;
		}
		finalize_tree(it->second, scale);
		++it;
	}
}
